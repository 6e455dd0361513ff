#include "property_codec.hpp"

#include <cctype>
#include <limits>

namespace tangorest {
namespace codec {

namespace {

// Strict non-negative decimal parse; rejects signs, blanks and overflow
bool parse_count(const std::string &text, size_t &count) {
    if (text.empty()) {
        return false;
    }
    size_t value = 0;
    for (unsigned char c : text) {
        if (std::isdigit(c) == 0) {
            return false;
        }
        const size_t digit = static_cast<size_t>(c - '0');
        if (value > (std::numeric_limits<size_t>::max() - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    count = value;
    return true;
}

void malformed(errors::ErrorStack &errors, const std::string &description) {
    errors.push_back(
        errors::make_error(errors::ErrorKind::MALFORMED_WIRE_DATA, description, "codec::decode_properties"));
}

bool decode_from(const remote::StringList &data, size_t start, PropertyList &properties,
                 errors::ErrorStack &errors) {
    properties.clear();
    if (data.size() <= start) {
        // No properties at all
        return true;
    }

    size_t property_count = 0;
    if (!parse_count(data[start], property_count)) {
        malformed(errors, "Property count '" + data[start] + "' is not a number");
        return false;
    }

    PropertyList decoded;
    size_t pos = start + 1;
    for (size_t i = 0; i < property_count; ++i) {
        if (pos + 1 >= data.size()) {
            malformed(errors, "Property array ends before property " + std::to_string(i + 1) + " of " +
                                  std::to_string(property_count));
            return false;
        }

        PropertyRecord record;
        record.name = data[pos];

        size_t value_count = 0;
        if (!parse_count(data[pos + 1], value_count)) {
            malformed(errors, "Value count '" + data[pos + 1] + "' of property '" + record.name + "' is not a number");
            return false;
        }

        const size_t first_value = pos + 2;
        if (value_count > data.size() - first_value) {
            malformed(errors, "Property '" + record.name + "' declares " + std::to_string(value_count) +
                                  " values but only " + std::to_string(data.size() - first_value) + " remain");
            return false;
        }

        record.values.assign(data.begin() + static_cast<std::ptrdiff_t>(first_value),
                             data.begin() + static_cast<std::ptrdiff_t>(first_value + value_count));
        decoded.push_back(std::move(record));
        pos = first_value + value_count;
    }

    properties = std::move(decoded);
    return true;
}

}  // namespace

remote::StringList encode_device_properties(const std::string &device, const PropertyList &properties) {
    remote::StringList args;
    args.push_back(device);
    args.push_back(std::to_string(properties.size()));
    for (const auto &property : properties) {
        args.push_back(property.name);
        args.push_back(std::to_string(property.values.size()));
        args.insert(args.end(), property.values.begin(), property.values.end());
    }
    return args;
}

remote::StringList encode_device_properties(const std::string &device, const PropertyMap &properties) {
    PropertyList list;
    list.reserve(properties.size());
    for (const auto &[name, values] : properties) {
        list.push_back(PropertyRecord{name, values});
    }
    return encode_device_properties(device, list);
}

bool decode_device_properties(const remote::StringList &data, PropertyList &properties,
                              errors::ErrorStack &errors) {
    return decode_from(data, 1, properties, errors);
}

bool decode_property_tail(const remote::StringList &data, PropertyList &properties, errors::ErrorStack &errors) {
    return decode_from(data, 0, properties, errors);
}

PropertyMap to_property_map(const PropertyList &properties) {
    PropertyMap map;
    for (const auto &property : properties) {
        map[property.name] = property.values;
    }
    return map;
}

}  // namespace codec
}  // namespace tangorest
