#ifndef DDSLEDGER_DDS_ORIGINATOR_HPP
#define DDSLEDGER_DDS_ORIGINATOR_HPP

#include "dds/content_types.hpp"
#include "network/network_service.hpp"

/*
  originator.hpp
  ----------------------------------------------------------------
  Announces locally published manifests to the network layer.

  Required Methods:
    void AdvertiseContent(const ContentID &manifestId)

  Advertising is best-effort. The caller has already stored the content, and a failure
  here leaves it usable locally but undiscoverable by peers; nothing is rolled back.
*/

namespace ddsledger {
namespace dds {

class IOriginator
{
public:
    virtual ~IOriginator() = default;

    virtual void AdvertiseContent(const ContentID &manifestId) = 0;
};

/**
 * @brief Registers manifests in a NetworkService's advertised-content set.
 */
class NetworkOriginator : public IOriginator
{
public:
    explicit NetworkOriginator(network::NetworkService &service)
        : service_(service)
    {
    }

    void AdvertiseContent(const ContentID &manifestId) override
    {
        service_.Advertise(manifestId);
    }

private:
    network::NetworkService &service_;
};

} // namespace dds
} // namespace ddsledger

#endif // DDSLEDGER_DDS_ORIGINATOR_HPP
