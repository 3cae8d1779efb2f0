#pragma once
/**
 * @file connection_store.hpp
 * @brief In-memory connection and DID document storage shared through the context.
 */

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "didagent/connections/connection_record.hpp"

namespace didagent::connections {

    /** @class ConnectionStore
     *  @brief Thread-safe record storage keyed by connection id.
     */
    class ConnectionStore {
    public:
        /// Insert or replace by connection_id.
        void save(const ConnectionRecord& record);

        [[nodiscard]] std::optional<ConnectionRecord> get(std::string_view connection_id) const;
        [[nodiscard]] std::optional<ConnectionRecord> find_by_invitation_key(std::string_view key) const;
        /// Record whose their_verkey and my_verkey match.
        [[nodiscard]] std::optional<ConnectionRecord> find_by_verkeys(std::string_view their_verkey,
                                                                      std::string_view my_verkey) const;
        bool remove(std::string_view connection_id);

        [[nodiscard]] std::vector<ConnectionRecord> list() const;
        [[nodiscard]] std::size_t size() const;

        void save_did_document(const DidDocument& doc);
        [[nodiscard]] std::optional<DidDocument> get_did_document(std::string_view did) const;

    private:
        mutable std::mutex mu_;
        std::map<std::string, ConnectionRecord, std::less<>> records_;
        std::map<std::string, DidDocument, std::less<>> did_docs_;
    };

} // namespace didagent::connections
