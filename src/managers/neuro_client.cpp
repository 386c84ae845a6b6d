#include "neuro_client.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <transport/http_transport.hpp>
#include <fmt/format.h>
#include <algorithm>

Result<std::unique_ptr<NeuroClient>> NeuroClient::create(const Config& config) {
    using R = Result<std::unique_ptr<NeuroClient>>;
    auto valid = config.validate();
    if (valid.is_err()) return R::Err(valid.error);

    if (!config.log_path().empty()) set_log_path(config.log_path());

    auto api = std::make_unique<HttpTransport>(config.api().url, config.api().token,
                                               config.api().timeout);
    auto storage = std::make_unique<HttpTransport>(config.storage().url, config.api().token,
                                                   config.api().timeout);
    auto state = std::make_unique<StateStore>(StateStore::default_path());

    neuro_log(fmt::format("neuro {} api={} storage={} concurrency={}", NEURO_VERSION,
                          config.api().url, config.storage().url, config.storage().concurrency));
    return R::Ok(std::make_unique<NeuroClient>(config, std::move(api), std::move(storage),
                                               std::move(state)));
}

NeuroClient::NeuroClient(const Config& config, std::unique_ptr<ApiTransport> api,
                         std::unique_ptr<ApiTransport> storage, std::unique_ptr<StateStore> state)
    : config_(config),
      api_(std::move(api)),
      storage_api_(std::move(storage)),
      state_(std::move(state)),
      policy_(config_.retry()),
      limiter_(static_cast<size_t>(std::max(config_.storage().concurrency, 1))),
      events_(EVENT_CHANNEL_CAPACITY),
      jobs_(*api_, policy_, limiter_, config_.jobs(), &events_, state_.get()),
      sync_(*storage_api_, policy_, limiter_, &events_) {}
