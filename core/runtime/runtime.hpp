#pragma once

#include <memory>
#include <string>

#include "config.hpp"
#include "service/device_service.hpp"
#include "service/request_dispatcher.hpp"
#include "service/service_context.hpp"
#include "sim/sim_backend.hpp"
#include "sim/sim_system.hpp"

namespace tangorest {
namespace runtime {

/**
 * @brief Wires the configured backend to the service layer
 *
 * Owns the simulated control system, the directory and connector adapters
 * over it, the service context (pool + directory cache) and the request
 * dispatcher. Requests may be handled once initialize() has succeeded.
 */
class Runtime {
public:
    explicit Runtime(const ServiceConfig &config);

    // Initialize all components (backend, context, service, dispatcher)
    bool initialize(std::string &error);

    service::ServiceResult handle(const service::Request &request);

    // Access to core components
    service::ServiceContext &get_context() { return *context_; }
    service::DeviceService &get_service() { return *service_; }
    sim::SimDirectory &get_directory_backend() { return *directory_backend_; }
    sim::SimConnector &get_connector() { return *connector_; }

private:
    // Staged initialization helpers
    bool init_backend(std::string &error);
    bool init_service(std::string &error);

    ServiceConfig config_;

    std::shared_ptr<sim::SimSystem> system_;
    std::shared_ptr<sim::SimDirectory> directory_backend_;
    std::shared_ptr<sim::SimConnector> connector_;
    std::unique_ptr<service::ServiceContext> context_;
    std::unique_ptr<service::DeviceService> service_;
    std::unique_ptr<service::RequestDispatcher> dispatcher_;
};

}  // namespace runtime
}  // namespace tangorest
