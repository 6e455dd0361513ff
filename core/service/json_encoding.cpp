#include "json_encoding.hpp"

#include "bridge/value_coercion.hpp"
#include "errors/error_envelope.hpp"

namespace tangorest {
namespace service {

nlohmann::json encode_attribute_result(const bridge::AttributeResult &result) {
    return {{"name", result.name},
            {"value", bridge::value_to_json(result.value)},
            {"quality", remote::quality_to_string(result.quality)},
            {"timestamp", errors::to_epoch_seconds(result.timestamp)}};
}

nlohmann::json encode_attribute_reading(const bridge::AttributeResult &result) {
    nlohmann::json j = {{"value", bridge::value_to_json(result.value)},
                        {"quality", remote::quality_to_string(result.quality)},
                        {"timestamp", errors::to_epoch_seconds(result.timestamp)}};
    if (result.w_value.has_value()) {
        j["w_value"] = bridge::value_to_json(*result.w_value);
    }
    if (result.has_failed) {
        j["has_failed"] = true;
    }
    return j;
}

nlohmann::json encode_attribute_descriptor(const remote::AttributeDescriptor &descriptor) {
    return {{"name", descriptor.name},
            {"data_type", remote::data_type_to_string(descriptor.data_type)},
            {"data_format", remote::data_format_to_string(descriptor.data_format)},
            {"description", descriptor.description},
            {"display_unit", descriptor.display_unit},
            {"extensions", descriptor.extensions},
            {"enum_labels", descriptor.enum_labels},
            {"format", descriptor.format},
            {"label", descriptor.label},
            {"level", remote::display_level_to_string(descriptor.disp_level)},
            {"min_alarm", descriptor.min_alarm},
            {"max_alarm", descriptor.max_alarm},
            {"max_dim_x", descriptor.max_dim_x},
            {"max_dim_y", descriptor.max_dim_y},
            {"min_value", descriptor.min_value},
            {"max_value", descriptor.max_value},
            {"standard_unit", descriptor.standard_unit},
            {"unit", descriptor.unit},
            {"writable", remote::write_type_to_string(descriptor.writable)},
            {"writable_attr_name", descriptor.writable_attr_name}};
}

nlohmann::json encode_command(const remote::CommandInfo &command) {
    return {{"name", command.cmd_name},
            {"info",
             {{"level", remote::display_level_to_string(command.disp_level)},
              {"cmd_tag", command.cmd_tag},
              {"in_type", command.in_type},
              {"out_type", command.out_type},
              {"in_type_desc", command.in_type_desc},
              {"out_type_desc", command.out_type_desc}}}};
}

nlohmann::json encode_properties(const codec::PropertyList &properties) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto &property : properties) {
        array.push_back({{"name", property.name}, {"values", property.values}});
    }
    return array;
}

nlohmann::json encode_device_info(const directory::DeviceDirectoryInfo &db_info, const remote::DeviceInfo &dev_info,
                                  const remote::ImportInfo &import_info) {
    return {{"classname", dev_info.dev_class},
            {"exported", import_info.exported},
            {"hostname", db_info.host},
            {"ior", db_info.ior},
            {"is_taco", false},
            {"last_exported", db_info.started_date},
            {"last_unexported", db_info.stopped_date},
            {"name", db_info.name},
            {"server", db_info.server},
            {"pid", db_info.pid},
            {"version", db_info.version}};
}

nlohmann::json encode_string_list(const remote::StringList &strings) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto &s : strings) {
        array.push_back(s);
    }
    return array;
}

}  // namespace service
}  // namespace tangorest
