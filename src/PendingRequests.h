/**
 * @file PendingRequests.h
 * @brief Outstanding fetches, keyed by request kind and content address
 *
 * A song and an album cover for the same path share an address, so the
 * kind is part of the key. Duplicates are counted: each request waits
 * for its own signal.
 */

#ifndef ASSETSYNC_PENDING_REQUESTS_H
#define ASSETSYNC_PENDING_REQUESTS_H

#include "SyncMessages.h"

#include <cstddef>
#include <set>
#include <string>
#include <utility>

class PendingRequests {
public:
    void expect(RequestType kind, const std::string& id) {
        m_items.insert({kind, id});
    }

    // Settle one entry matching the signal. False if the signal answers
    // nothing tracked here (connection loss, bootstrap failure).
    bool resolve(const Signal& signal) {
        RequestType kind;
        switch (signal.type) {
            case SignalType::DOWNLOAD_COMPLETE:    kind = RequestType::FETCH_SONG; break;
            case SignalType::ALBUM_COVER_COMPLETE: kind = RequestType::FETCH_ALBUM_COVER; break;
            case SignalType::TRANSFER_FAILED:      kind = signal.source; break;
            default:                               return false;
        }
        auto it = m_items.find({kind, signal.id});
        if (it == m_items.end()) return false;
        m_items.erase(it);
        return true;
    }

    bool empty() const { return m_items.empty(); }
    size_t size() const { return m_items.size(); }

private:
    std::multiset<std::pair<RequestType, std::string>> m_items;
};

#endif // ASSETSYNC_PENDING_REQUESTS_H
