#ifndef DDSLEDGER_USER_PROFILE_HPP
#define DDSLEDGER_USER_PROFILE_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "dds/content_codec.hpp"
#include "util/errors.hpp"
#include "util/hashing.hpp"

/**
 * @file profile.hpp
 * @brief Versioned user profile stored as DDS content.
 *
 * A profile is immutable content once published. An edit produces a new Profile value with
 * version + 1 and a new content ID; the versions are tied together on the ledger by
 * ProfileUpdated transactions from the owner (see profile_manager.hpp).
 *
 * Limits:
 *   - ownerAddress and displayName are required
 *   - displayName at most 50 bytes, bio at most 500 bytes
 *   - pictureCid empty or a content ID
 *   - version starts at 1
 *
 * Wire form (codec Writer, big-endian):
 *   "ddsledger-profile/1", ownerAddress, displayName, bio, pictureCid, u64 timestamp, u32 version
 */

namespace ddsledger {
namespace user {

constexpr size_t kMaxDisplayNameLength = 50;
constexpr size_t kMaxBioLength = 500;

class Profile
{
public:
    std::string ownerAddress;
    std::string displayName;
    std::string bio;
    std::string pictureCid;
    int64_t     timestamp{0}; // Unix nanoseconds of the last change
    uint32_t    version{0};

public:
    Profile() = default;

    /**
     * @brief First version of a profile.
     * @throw MalformedInputError if a field breaks the limits.
     */
    static Profile NewProfile(const std::string &ownerAddress,
                              const std::string &displayName,
                              const std::string &bio = "",
                              const std::string &pictureCid = "",
                              int64_t timestamp = currentTimestamp())
    {
        Profile p;
        p.ownerAddress = ownerAddress;
        p.displayName = displayName;
        p.bio = bio;
        p.pictureCid = pictureCid;
        p.timestamp = timestamp;
        p.version = 1;
        p.Validate();
        return p;
    }

    /**
     * @brief Apply an edit. An empty displayName keeps the current one; bio and pictureCid are
     *        taken as given, so an empty value clears them.
     *
     * The edit is checked before anything changes. The version and timestamp move only if a
     * field actually changed.
     *
     * @return true if the profile changed.
     * @throw MalformedInputError if the edited profile would break the limits.
     */
    bool Update(const std::string &newDisplayName,
                const std::string &newBio,
                const std::string &newPictureCid,
                int64_t timestamp = currentTimestamp())
    {
        Profile next = *this;
        if (!newDisplayName.empty()) {
            next.displayName = newDisplayName;
        }
        next.bio = newBio;
        next.pictureCid = newPictureCid;
        next.Validate();

        if (next.displayName == displayName && next.bio == bio && next.pictureCid == pictureCid) {
            return false;
        }
        next.version = version + 1;
        next.timestamp = timestamp > this->timestamp ? timestamp : this->timestamp + 1;
        *this = std::move(next);
        return true;
    }

    /// @throw MalformedInputError naming the first broken limit.
    void Validate() const
    {
        if (ownerAddress.empty()) {
            throw util::MalformedInputError("Profile: owner address cannot be empty");
        }
        if (displayName.empty()) {
            throw util::MalformedInputError("Profile: display name cannot be empty");
        }
        if (displayName.size() > kMaxDisplayNameLength) {
            throw util::MalformedInputError("Profile: display name exceeds "
                                            + std::to_string(kMaxDisplayNameLength) + " bytes");
        }
        if (bio.size() > kMaxBioLength) {
            throw util::MalformedInputError("Profile: bio exceeds "
                                            + std::to_string(kMaxBioLength) + " bytes");
        }
        if (!pictureCid.empty() && !util::hashing::isSha256Hex(pictureCid)) {
            throw util::MalformedInputError("Profile: picture '" + pictureCid
                                            + "' is not a content ID");
        }
        if (version < 1) {
            throw util::MalformedInputError("Profile: version must be at least 1");
        }
    }

    std::vector<uint8_t> Serialize() const
    {
        Validate();
        dds::codec::Writer w;
        w.PutString(kFormatTag);
        w.PutString(ownerAddress);
        w.PutString(displayName);
        w.PutString(bio);
        w.PutString(pictureCid);
        w.PutU64(static_cast<uint64_t>(timestamp));
        w.PutU32(version);
        return w.Take();
    }

    /// @throw MalformedInputError on foreign, truncated or invalid input.
    static Profile Deserialize(const std::vector<uint8_t> &bytes)
    {
        dds::codec::Reader r(bytes, "profile");
        if (r.GetString() != kFormatTag) {
            throw util::MalformedInputError("Profile: content is not a profile");
        }
        Profile p;
        p.ownerAddress = r.GetString();
        p.displayName = r.GetString();
        p.bio = r.GetString();
        p.pictureCid = r.GetString();
        p.timestamp = static_cast<int64_t>(r.GetU64());
        p.version = r.GetU32();
        r.ExpectEnd();
        p.Validate();
        return p;
    }

    bool operator==(const Profile &other) const
    {
        return ownerAddress == other.ownerAddress && displayName == other.displayName
            && bio == other.bio && pictureCid == other.pictureCid
            && timestamp == other.timestamp && version == other.version;
    }

    bool operator!=(const Profile &other) const { return !(*this == other); }

    static int64_t currentTimestamp()
    {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
    }

private:
    static constexpr const char *kFormatTag = "ddsledger-profile/1";
};

} // namespace user
} // namespace ddsledger

#endif // DDSLEDGER_USER_PROFILE_HPP
