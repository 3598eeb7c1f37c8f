#include "instrumentation/shim.hpp"
#include "core/utils.hpp"

#include <format>

namespace apmcore {

namespace {

constexpr std::string_view kLocalhost = "localhost";

bool is_socket_path(std::string_view host) {
    return host.starts_with('/') || host.ends_with(".sock");
}

} // anonymous namespace

std::shared_ptr<Segment> Shim::start_operation(const OperationSpec& operation) const {
    auto segment = tracer_.create_segment(operation.name, operation.recorder);
    if (!segment->is_recording()) {
        utils::log::trace(std::format("[{}] {} is not recorded", module_name_, operation.name));
        return segment;
    }

    for (const auto& [key, value] : operation.parameters) {
        segment->add_attribute(key, value);
    }
    if (operation.opaque) {
        segment->set_opaque(true);
    }
    return segment;
}

AttributeMap Shim::instance_parameters(std::string_view host,
                                       std::string_view port_path_or_id,
                                       std::string_view database_name) {
    std::string resolved_host(host);
    std::string resolved_port(port_path_or_id);
    if (is_socket_path(host)) {
        resolved_port = resolved_host;
        resolved_host = kLocalhost;
    }

    AttributeMap params;
    if (!resolved_host.empty()) params.emplace("host", std::move(resolved_host));
    if (!resolved_port.empty()) params.emplace("port_path_or_id", std::move(resolved_port));
    if (!database_name.empty()) params.emplace("database_name", std::string(database_name));
    return params;
}

bool Shim::capture_instance_attributes(std::string_view host,
                                       std::string_view port_path_or_id,
                                       std::string_view database_name) const {
    const auto segment = tracer_.get_segment();
    if (!segment) return false;

    bool added = true;
    for (auto& [key, value] : instance_parameters(host, port_path_or_id, database_name)) {
        added = segment->add_attribute(key, std::move(value)) && added;
    }
    return added;
}

} // namespace apmcore
