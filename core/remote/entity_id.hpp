#ifndef TANGOREST_REMOTE_ENTITY_ID_HPP
#define TANGOREST_REMOTE_ENTITY_ID_HPP

#include <optional>
#include <string>

namespace tangorest {
namespace remote {

/**
 * @brief Three-segment device name: domain/family/member
 *
 * Immutable once constructed. Only parse() creates instances, so every
 * EntityId in the system is well-formed.
 */
class EntityId {
public:
    /**
     * @brief Parse "domain/family/member"
     *
     * Requires exactly three non-empty segments without whitespace.
     *
     * @param name Full device name
     * @param error Optional output for the rejection reason
     * @return EntityId, or nullopt when malformed
     */
    static std::optional<EntityId> parse(const std::string &name, std::string *error = nullptr);

    // Build from already separated segments (same validation as parse)
    static std::optional<EntityId> from_segments(const std::string &domain, const std::string &family,
                                                 const std::string &member, std::string *error = nullptr);

    const std::string &domain() const { return domain_; }
    const std::string &family() const { return family_; }
    const std::string &member() const { return member_; }
    const std::string &str() const { return full_; }

    bool operator==(const EntityId &other) const { return full_ == other.full_; }
    bool operator!=(const EntityId &other) const { return full_ != other.full_; }
    bool operator<(const EntityId &other) const { return full_ < other.full_; }

private:
    EntityId(std::string domain, std::string family, std::string member);

    std::string domain_;
    std::string family_;
    std::string member_;
    std::string full_;
};

}  // namespace remote
}  // namespace tangorest

#endif  // TANGOREST_REMOTE_ENTITY_ID_HPP
