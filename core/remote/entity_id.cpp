#include "entity_id.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace tangorest {
namespace remote {

namespace {

bool valid_segment(const std::string &segment) {
    if (segment.empty()) {
        return false;
    }
    return std::none_of(segment.begin(), segment.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

EntityId::EntityId(std::string domain, std::string family, std::string member)
    : domain_(std::move(domain)), family_(std::move(family)), member_(std::move(member)) {
    full_ = domain_ + "/" + family_ + "/" + member_;
}

std::optional<EntityId> EntityId::parse(const std::string &name, std::string *error) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        size_t slash = name.find('/', start);
        if (slash == std::string::npos) {
            segments.push_back(name.substr(start));
            break;
        }
        segments.push_back(name.substr(start, slash - start));
        start = slash + 1;
    }

    if (segments.size() != 3) {
        if (error != nullptr) {
            *error = "Device name '" + name + "' must have the form domain/family/member";
        }
        return std::nullopt;
    }
    return from_segments(segments[0], segments[1], segments[2], error);
}

std::optional<EntityId> EntityId::from_segments(const std::string &domain, const std::string &family,
                                                const std::string &member, std::string *error) {
    if (!valid_segment(domain) || !valid_segment(family) || !valid_segment(member) ||
        domain.find('/') != std::string::npos || family.find('/') != std::string::npos ||
        member.find('/') != std::string::npos) {
        if (error != nullptr) {
            *error = "Invalid device name segments: '" + domain + "', '" + family + "', '" + member + "'";
        }
        return std::nullopt;
    }
    return EntityId(domain, family, member);
}

}  // namespace remote
}  // namespace tangorest
