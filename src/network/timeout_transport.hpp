#ifndef DDSLEDGER_NETWORK_TIMEOUT_TRANSPORT_HPP
#define DDSLEDGER_NETWORK_TIMEOUT_TRANSPORT_HPP

#include <chrono>
#include <future>
#include <string>
#include "network/transport.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"
#include "util/thread_pool.hpp"

namespace ddsledger {
namespace network {

/*
  TimeoutTransport
  --------------------------------
  Decorator that bounds every request to another ITransport with a deadline.
  Each request runs on a worker of an owned util::ThreadPool; if it has not completed
  when the deadline passes, the caller gets TransportError and moves on to the next
  source. The late request finishes in the background and its result is discarded.

  The wrapped transport must outlive this object.
*/
class TimeoutTransport : public ITransport {
  public:
    TimeoutTransport(ITransport& inner, std::chrono::milliseconds timeout, size_t workers = 4)
        : m_inner(inner), m_timeout(timeout), m_pool(workers == 0 ? 1 : workers) {
        if (m_timeout.count() <= 0) {
            throw util::MalformedInputError("TimeoutTransport: timeout must be positive");
        }
    }

    dds::Manifest RequestManifest(const PeerNode& peer, const dds::ContentID& id) override {
        ITransport& inner = m_inner;
        auto fut = m_pool.enqueue([&inner, peer, id]() { return inner.RequestManifest(peer, id); });
        return await(fut, peer, "manifest", id);
    }

    dds::Chunk RequestChunk(const PeerNode& peer, const dds::ContentID& id) override {
        ITransport& inner = m_inner;
        auto fut = m_pool.enqueue([&inner, peer, id]() { return inner.RequestChunk(peer, id); });
        return await(fut, peer, "chunk", id);
    }

    std::chrono::milliseconds GetTimeout() const { return m_timeout; }

  private:
    template <typename T>
    T await(std::future<T>& fut, const PeerNode& peer, const char* what,
            const dds::ContentID& id) {
        if (fut.wait_for(m_timeout) == std::future_status::timeout) {
            util::logger::warn("[TimeoutTransport] " + std::string(what) + " request for " + id +
                               " to " + peer.ID + " timed out after " +
                               std::to_string(m_timeout.count()) + "ms");
            throw util::TransportError("request to " + peer.ID + " timed out");
        }
        return fut.get();
    }

    ITransport& m_inner;
    std::chrono::milliseconds m_timeout;
    // last member: joined first on destruction, while m_inner is still valid
    util::ThreadPool m_pool;
};

} // namespace network
} // namespace ddsledger

#endif // DDSLEDGER_NETWORK_TIMEOUT_TRANSPORT_HPP
