#include "user/profile_manager.hpp"
#include "core/transaction.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

namespace ddsledger {
namespace user {

dds::ContentID ProfileManager::PublishProfile(const Profile& profile) {
    dds::ContentID cid = m_dds.Publish(profile.Serialize());
    util::logger::info("[ProfileManager] Profile of " + profile.ownerAddress + " (version " +
                       std::to_string(profile.version) + ") published as " + cid);
    return cid;
}

Profile ProfileManager::RetrieveProfile(const dds::ContentID& cid) {
    if (cid.empty()) {
        throw util::MalformedInputError("ProfileManager: profile ID cannot be empty");
    }
    std::vector<uint8_t> bytes = m_dds.Retrieve(cid);
    try {
        return Profile::Deserialize(bytes);
    } catch (const util::MalformedInputError& ex) {
        throw util::MalformedInputError("ProfileManager: content " + cid +
                                        " is not a valid profile: " + ex.what());
    }
}

PublishedProfile ProfileManager::PublishAndRecord(const Profile& profile,
                                                  const identity::Wallet& owner) {
    profile.Validate();
    if (owner.GetAddress() != profile.ownerAddress) {
        throw util::MalformedInputError("ProfileManager: wallet " + owner.GetAddress() +
                                        " does not own the profile of " + profile.ownerAddress);
    }

    std::vector<dds::ContentID> history = GetProfileHistory(profile.ownerAddress);
    if (history.empty()) {
        if (profile.version != 1) {
            throw util::MalformedInputError("ProfileManager: first recorded profile of " +
                                            profile.ownerAddress + " must be version 1, got " +
                                            std::to_string(profile.version));
        }
    } else {
        Profile last = RetrieveProfile(history.back());
        if (profile.version <= last.version) {
            throw util::MalformedInputError("ProfileManager: version " +
                                            std::to_string(profile.version) + " of " +
                                            profile.ownerAddress + " does not follow recorded version " +
                                            std::to_string(last.version));
        }
    }

    PublishedProfile out;
    out.profile = profile;
    out.contentId = PublishProfile(profile);

    auto tx = core::Transaction::NewTransaction(profile.ownerAddress,
                                                core::TransactionType::ProfileUpdated,
                                                out.contentId);
    tx.Sign(owner.GetPrivateKeyBytes());
    auto blk = m_ledger.AddBlock({tx});
    out.transactionId = tx.GetID();
    util::logger::info("[ProfileManager] Version " + std::to_string(profile.version) + " of " +
                       profile.ownerAddress + " recorded in block " +
                       std::to_string(blk->header.index));
    return out;
}

PublishedProfile ProfileManager::UpdateAndPublishProfile(const Profile& current,
                                                         const std::string& newDisplayName,
                                                         const std::string& newBio,
                                                         const std::string& newPictureCid,
                                                         const identity::Wallet& owner) {
    Profile next = current;
    if (!next.Update(newDisplayName, newBio, newPictureCid)) {
        util::logger::info("[ProfileManager] No change to the profile of " + current.ownerAddress +
                           ", nothing recorded");
        PublishedProfile unchanged;
        unchanged.profile = current;
        unchanged.contentId = PublishProfile(current);
        return unchanged;
    }
    return PublishAndRecord(next, owner);
}

Profile ProfileManager::GetLatestProfile(const std::string& ownerAddress) {
    std::vector<dds::ContentID> history = GetProfileHistory(ownerAddress);
    if (history.empty()) {
        throw util::NotFoundError("ProfileManager: no profile recorded for " + ownerAddress);
    }
    Profile latest = RetrieveProfile(history.back());
    if (latest.ownerAddress != ownerAddress) {
        throw util::IntegrityError("ProfileManager: profile " + history.back() + " recorded by " +
                                   ownerAddress + " belongs to " + latest.ownerAddress);
    }
    return latest;
}

std::vector<dds::ContentID> ProfileManager::GetProfileHistory(
    const std::string& ownerAddress) const {
    std::vector<dds::ContentID> out;
    for (const auto& tx : m_ledger.GetTransactionsBySender(ownerAddress)) {
        if (tx.GetType() == core::TransactionType::ProfileUpdated) {
            out.push_back(tx.GetPayloadAsString());
        }
    }
    return out;
}

} // namespace user
} // namespace ddsledger
