#ifndef DDSLEDGER_USER_PROFILE_MANAGER_HPP
#define DDSLEDGER_USER_PROFILE_MANAGER_HPP

#include <string>
#include <vector>
#include "core/blockchain.hpp"
#include "dds/content_types.hpp"
#include "dds/dds_service.hpp"
#include "identity/wallet.hpp"
#include "user/profile.hpp"

namespace ddsledger {
namespace user {

/*
  ProfileManager
  --------------------------------------------------------
  Profiles on DDS, their versions on the ledger.

  Required Methods:
    dds::ContentID PublishProfile(const Profile &profile)
    Profile RetrieveProfile(const dds::ContentID &cid)
    PublishedProfile PublishAndRecord(const Profile &profile, const identity::Wallet &owner)
    PublishedProfile UpdateAndPublishProfile(const Profile &current, displayName, bio,
                                             pictureCid, const identity::Wallet &owner)
    Profile GetLatestProfile(const std::string &ownerAddress)
    std::vector<dds::ContentID> GetProfileHistory(const std::string &ownerAddress)

  Each recorded version is a ProfileUpdated transaction signed by the owner, carrying the
  profile's content ID as payload, in its own block. The ledger is the link between versions:
  the owner's newest ProfileUpdated transaction names the current profile.

  Managers on different nodes share one Blockchain and each read through their own
  DdsCoreService, so a profile recorded by one node is fetched over P2P by another.
*/

struct PublishedProfile {
    Profile profile;
    dds::ContentID contentId;
    std::string transactionId; // empty when nothing new was recorded
};

class ProfileManager {
  public:
    ProfileManager(dds::DdsCoreService& dds, core::Blockchain& ledger)
        : m_dds(dds), m_ledger(ledger) {}

    /// Validate, serialise and publish. @throw MalformedInputError on an invalid profile.
    dds::ContentID PublishProfile(const Profile& profile);

    /**
     * @throw MalformedInputError for an empty ID or content that is not a valid profile.
     * @throw NotFoundError / TransportError / IntegrityError as DdsCoreService::Retrieve().
     */
    Profile RetrieveProfile(const dds::ContentID& cid);

    /**
     * @brief Publish and append a signed ProfileUpdated transaction for it.
     * @throw MalformedInputError if owner is not the profile's owner, or the version does not
     *        follow the last recorded one.
     */
    PublishedProfile PublishAndRecord(const Profile& profile, const identity::Wallet& owner);

    /**
     * @brief Apply an edit (see Profile::Update) and record the new version.
     *        An edit that changes nothing records nothing and returns the current profile.
     */
    PublishedProfile UpdateAndPublishProfile(const Profile& current,
                                             const std::string& newDisplayName,
                                             const std::string& newBio,
                                             const std::string& newPictureCid,
                                             const identity::Wallet& owner);

    /**
     * @brief The profile named by the owner's newest ProfileUpdated transaction.
     * @throw NotFoundError if the owner never recorded one.
     * @throw IntegrityError if the retrieved profile belongs to someone else.
     */
    Profile GetLatestProfile(const std::string& ownerAddress);

    /// Content IDs of every recorded version, oldest first.
    std::vector<dds::ContentID> GetProfileHistory(const std::string& ownerAddress) const;

  private:
    dds::DdsCoreService& m_dds;
    core::Blockchain& m_ledger;
};

} // namespace user
} // namespace ddsledger

#endif // DDSLEDGER_USER_PROFILE_MANAGER_HPP
