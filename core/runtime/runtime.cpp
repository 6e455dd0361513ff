#include "runtime.hpp"

#include <chrono>

#include "errors/error_envelope.hpp"
#include "logging/logger.hpp"

namespace tangorest {
namespace runtime {

Runtime::Runtime(const ServiceConfig &config) : config_(config) {}

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing tangorest");

    if (!init_backend(error)) {
        return false;
    }

    if (!init_service(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_backend(std::string &error) {
    system_ = std::make_shared<sim::SimSystem>();
    if (!system_->load(config_.simulation, config_.directory.device, error)) {
        error = "Simulation load failed: " + error;
        return false;
    }

    directory_backend_ = std::make_shared<sim::SimDirectory>(system_);
    connector_ = std::make_shared<sim::SimConnector>(system_);
    LOG_INFO("[Runtime] Simulation backend ready (" << system_->device_count() << " devices)");
    return true;
}

bool Runtime::init_service(std::string &error) {
    if (config_.pool.max_handles < 1) {
        error = "pool.max_handles must be >= 1";
        return false;
    }

    service::ContextOptions options;
    options.directory_ttl = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(config_.cache.ttl_seconds));
    options.max_handles = static_cast<size_t>(config_.pool.max_handles);

    context_ = std::make_unique<service::ServiceContext>(directory_backend_, connector_, options);
    service_ = std::make_unique<service::DeviceService>(*context_);
    dispatcher_ = std::make_unique<service::RequestDispatcher>(*service_);

    LOG_INFO("[Runtime] Service context created (ttl " << config_.cache.ttl_seconds << "s, pool "
                                                       << options.max_handles << ")");
    return true;
}

service::ServiceResult Runtime::handle(const service::Request &request) {
    if (!dispatcher_) {
        errors::ErrorStack stack = {errors::make_error(errors::ErrorKind::INVALID_REQUEST,
                                                       "Runtime not initialized", "Runtime::handle")};
        return service::ServiceResult::failure(stack);
    }
    return dispatcher_->dispatch(request);
}

}  // namespace runtime
}  // namespace tangorest
