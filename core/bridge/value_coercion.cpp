#include "value_coercion.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cfloat>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <type_traits>
#include <vector>

namespace tangorest {
namespace bridge {

using remote::DataFormat;
using remote::DataType;
using remote::RemoteValue;

namespace {

std::string trim(const std::string &s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])) != 0) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) --end;
    return s.substr(begin, end - begin);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool integer_range(DataType type, int64_t &min, int64_t &max) {
    switch (type) {
        case DataType::DEV_SHORT:
            min = std::numeric_limits<int16_t>::min();
            max = std::numeric_limits<int16_t>::max();
            return true;
        case DataType::DEV_LONG:
            min = std::numeric_limits<int32_t>::min();
            max = std::numeric_limits<int32_t>::max();
            return true;
        case DataType::DEV_LONG64:
            min = std::numeric_limits<int64_t>::min();
            max = std::numeric_limits<int64_t>::max();
            return true;
        case DataType::DEV_USHORT:
            min = 0;
            max = std::numeric_limits<uint16_t>::max();
            return true;
        case DataType::DEV_ULONG:
            min = 0;
            max = std::numeric_limits<uint32_t>::max();
            return true;
        case DataType::DEV_ULONG64:
            min = 0;
            max = std::numeric_limits<int64_t>::max();
            return true;
        case DataType::DEV_UCHAR:
            min = 0;
            max = std::numeric_limits<uint8_t>::max();
            return true;
        default:
            return false;
    }
}

bool parse_bool(const std::string &text, bool &out) {
    const std::string lower = to_lower(trim(text));
    if (lower == "true" || lower == "1") {
        out = true;
        return true;
    }
    if (lower == "false" || lower == "0") {
        out = false;
        return true;
    }
    return false;
}

bool parse_int(const std::string &text, DataType type, int64_t &out, std::string &error) {
    const std::string t = trim(text);
    if (t.empty()) {
        error = "empty integer";
        return false;
    }
    errno = 0;
    char *end = nullptr;
    const long long parsed = std::strtoll(t.c_str(), &end, 10);
    if (end != t.c_str() + t.size()) {
        error = "'" + t + "' is not an integer";
        return false;
    }
    if (errno == ERANGE) {
        error = "'" + t + "' is out of range";
        return false;
    }
    int64_t min = 0;
    int64_t max = 0;
    integer_range(type, min, max);
    if (parsed < min || parsed > max) {
        error = "'" + t + "' is out of range for " + remote::data_type_to_string(type);
        return false;
    }
    out = static_cast<int64_t>(parsed);
    return true;
}

bool parse_float(const std::string &text, DataType type, double &out, std::string &error) {
    const std::string t = trim(text);
    if (t.empty()) {
        error = "empty number";
        return false;
    }
    errno = 0;
    char *end = nullptr;
    const double parsed = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size()) {
        error = "'" + t + "' is not a number";
        return false;
    }
    if (errno == ERANGE && std::isinf(parsed)) {
        error = "'" + t + "' is out of range";
        return false;
    }
    if (type == DataType::DEV_FLOAT && std::isfinite(parsed) && std::fabs(parsed) > FLT_MAX) {
        error = "'" + t + "' is out of range for DevFloat";
        return false;
    }
    out = parsed;
    return true;
}

bool parse_state(const std::string &text, remote::DeviceState &out, std::string &error) {
    const std::string t = trim(text);
    if (auto state = remote::device_state_from_string(t)) {
        out = *state;
        return true;
    }
    int64_t code = 0;
    std::string int_error;
    if (parse_int(t, DataType::DEV_LONG, code, int_error)) {
        if (auto state = remote::device_state_from_code(code)) {
            out = *state;
            return true;
        }
    }
    error = "'" + t + "' is not a device state";
    return false;
}

bool parse_enum(const std::string &text, const remote::AttributeDescriptor &descriptor, int64_t &out,
                std::string &error) {
    const std::string t = trim(text);
    const auto &labels = descriptor.enum_labels;
    auto it = std::find(labels.begin(), labels.end(), t);
    if (it != labels.end()) {
        out = static_cast<int64_t>(it - labels.begin());
        return true;
    }
    int64_t index = 0;
    std::string int_error;
    if (parse_int(t, DataType::DEV_SHORT, index, int_error) && index >= 0 &&
        (labels.empty() || static_cast<size_t>(index) < labels.size())) {
        out = index;
        return true;
    }
    error = "'" + t + "' is not a label of enum attribute " + descriptor.name;
    return false;
}

std::vector<std::string> split_spectrum(const std::string &text) {
    std::string body = trim(text);
    if (body.size() >= 2 && body.front() == '[' && body.back() == ']') {
        body = trim(body.substr(1, body.size() - 2));
    }
    std::vector<std::string> items;
    if (body.empty()) {
        return items;
    }
    size_t start = 0;
    while (true) {
        size_t comma = body.find(',', start);
        std::string item = trim(body.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (item.size() >= 2 && (item.front() == '"' || item.front() == '\'') && item.back() == item.front()) {
            item = item.substr(1, item.size() - 2);
        }
        items.push_back(item);
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return items;
}

bool coerce_scalar(const std::string &text, const remote::AttributeDescriptor &descriptor, RemoteValue &value,
                   std::string &error) {
    const DataType type = descriptor.data_type;
    if (type == DataType::DEV_BOOLEAN) {
        bool b = false;
        if (!parse_bool(text, b)) {
            error = "'" + text + "' is not a boolean";
            return false;
        }
        value = b;
        return true;
    }
    if (remote::is_integer_type(type)) {
        int64_t i = 0;
        if (!parse_int(text, type, i, error)) {
            return false;
        }
        value = i;
        return true;
    }
    if (remote::is_float_type(type)) {
        double d = 0.0;
        if (!parse_float(text, type, d, error)) {
            return false;
        }
        value = d;
        return true;
    }
    if (type == DataType::DEV_STRING) {
        value = text;
        return true;
    }
    if (type == DataType::DEV_STATE) {
        remote::DeviceState state = remote::DeviceState::UNKNOWN;
        if (!parse_state(text, state, error)) {
            return false;
        }
        value = state;
        return true;
    }
    if (type == DataType::DEV_ENUM) {
        int64_t index = 0;
        if (!parse_enum(text, descriptor, index, error)) {
            return false;
        }
        value = index;
        return true;
    }
    error = std::string("unsupported data type ") + remote::data_type_to_string(type);
    return false;
}

template <typename T>
bool collect(const std::vector<std::string> &items, const remote::AttributeDescriptor &descriptor,
             std::vector<T> &out, std::string &error) {
    out.clear();
    out.reserve(items.size());
    for (const auto &item : items) {
        RemoteValue element;
        if (!coerce_scalar(item, descriptor, element, error)) {
            return false;
        }
        out.push_back(std::get<T>(element));
    }
    return true;
}

bool coerce_spectrum(const std::string &text, const remote::AttributeDescriptor &descriptor, RemoteValue &value,
                     std::string &error) {
    const DataType type = descriptor.data_type;
    const auto items = split_spectrum(text);

    if (descriptor.max_dim_x > 0 && items.size() > static_cast<size_t>(descriptor.max_dim_x)) {
        error = std::to_string(items.size()) + " elements exceed max_dim_x " + std::to_string(descriptor.max_dim_x);
        return false;
    }

    if (type == DataType::DEV_BOOLEAN) {
        std::vector<bool> out;
        if (!collect(items, descriptor, out, error)) return false;
        value = std::move(out);
        return true;
    }
    if (remote::is_integer_type(type) || type == DataType::DEV_ENUM) {
        std::vector<int64_t> out;
        if (!collect(items, descriptor, out, error)) return false;
        value = std::move(out);
        return true;
    }
    if (remote::is_float_type(type)) {
        std::vector<double> out;
        if (!collect(items, descriptor, out, error)) return false;
        value = std::move(out);
        return true;
    }
    if (type == DataType::DEV_STRING) {
        value = items;
        return true;
    }
    error = std::string("spectrum of ") + remote::data_type_to_string(type) + " is not supported";
    return false;
}

}  // namespace

bool coerce_value(const std::string &text, const remote::AttributeDescriptor &descriptor, RemoteValue &value,
                  std::string &error) {
    switch (descriptor.data_format) {
        case DataFormat::SCALAR:
            return coerce_scalar(text, descriptor, value, error);
        case DataFormat::SPECTRUM:
            return coerce_spectrum(text, descriptor, value, error);
        case DataFormat::IMAGE:
        default:
            error = "writing IMAGE attributes is not supported";
            return false;
    }
}

RemoteValue render_value(const RemoteValue &value, const remote::AttributeDescriptor &descriptor) {
    if (descriptor.data_type == DataType::DEV_ENUM && std::holds_alternative<int64_t>(value)) {
        const int64_t index = std::get<int64_t>(value);
        if (index >= 0 && static_cast<size_t>(index) < descriptor.enum_labels.size()) {
            return descriptor.enum_labels[static_cast<size_t>(index)];
        }
        return value;
    }
    if (descriptor.data_type == DataType::DEV_ENUM && std::holds_alternative<std::vector<int64_t>>(value)) {
        // All-or-nothing: one unknown index leaves the whole spectrum numeric
        const auto &indices = std::get<std::vector<int64_t>>(value);
        std::vector<std::string> labels;
        labels.reserve(indices.size());
        for (int64_t index : indices) {
            if (index < 0 || static_cast<size_t>(index) >= descriptor.enum_labels.size()) {
                return value;
            }
            labels.push_back(descriptor.enum_labels[static_cast<size_t>(index)]);
        }
        return labels;
    }
    return render_value(value);
}

RemoteValue render_value(const RemoteValue &value) {
    if (std::holds_alternative<remote::DeviceState>(value)) {
        return std::string(remote::device_state_to_string(std::get<remote::DeviceState>(value)));
    }
    return value;
}

nlohmann::json value_to_json(const RemoteValue &value) {
    return std::visit(
        [](auto &&arg) -> nlohmann::json {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, remote::DeviceState>) {
                return remote::device_state_to_string(arg);
            } else if constexpr (std::is_same_v<T, std::vector<bool>>) {
                nlohmann::json array = nlohmann::json::array();
                for (bool b : arg) {
                    array.push_back(b);
                }
                return array;
            } else {
                return arg;
            }
        },
        value);
}

const char *value_type_name(const RemoteValue &value) {
    return std::visit(
        [](auto &&arg) -> const char * {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, bool>) return "bool";
            else if constexpr (std::is_same_v<T, int64_t>) return "int64";
            else if constexpr (std::is_same_v<T, double>) return "double";
            else if constexpr (std::is_same_v<T, std::string>) return "string";
            else if constexpr (std::is_same_v<T, remote::DeviceState>) return "state";
            else if constexpr (std::is_same_v<T, std::vector<bool>>) return "bool[]";
            else if constexpr (std::is_same_v<T, std::vector<int64_t>>) return "int64[]";
            else if constexpr (std::is_same_v<T, std::vector<double>>) return "double[]";
            else return "string[]";
        },
        value);
}

}  // namespace bridge
}  // namespace tangorest
