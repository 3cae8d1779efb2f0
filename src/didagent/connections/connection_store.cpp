/**
 * @file connection_store.cpp
 */
#include "didagent/connections/connection_store.hpp"

namespace didagent::connections {

    void ConnectionStore::save(const ConnectionRecord& record) {
        std::lock_guard<std::mutex> lk(mu_);
        records_.insert_or_assign(record.connection_id, record);
    }

    std::optional<ConnectionRecord> ConnectionStore::get(std::string_view connection_id) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = records_.find(connection_id);
        if (it == records_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<ConnectionRecord> ConnectionStore::find_by_invitation_key(std::string_view key) const {
        if (key.empty()) return std::nullopt;
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& [id, r] : records_) {
            if (r.invitation_key == key) return r;
        }
        return std::nullopt;
    }

    std::optional<ConnectionRecord> ConnectionStore::find_by_verkeys(std::string_view their_verkey,
                                                                     std::string_view my_verkey) const {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& [id, r] : records_) {
            if (!r.their_verkey.empty() && r.their_verkey == their_verkey && r.my_verkey == my_verkey) return r;
        }
        return std::nullopt;
    }

    bool ConnectionStore::remove(std::string_view connection_id) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = records_.find(connection_id);
        if (it == records_.end()) return false;
        records_.erase(it);
        return true;
    }

    std::vector<ConnectionRecord> ConnectionStore::list() const {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<ConnectionRecord> out;
        out.reserve(records_.size());
        for (const auto& [id, r] : records_) out.push_back(r);
        return out;
    }

    std::size_t ConnectionStore::size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return records_.size();
    }

    void ConnectionStore::save_did_document(const DidDocument& doc) {
        std::lock_guard<std::mutex> lk(mu_);
        did_docs_.insert_or_assign(doc.did, doc);
    }

    std::optional<DidDocument> ConnectionStore::get_did_document(std::string_view did) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = did_docs_.find(did);
        if (it == did_docs_.end()) return std::nullopt;
        return it->second;
    }

} // namespace didagent::connections
