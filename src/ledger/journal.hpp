// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_JOURNAL_H_
#define CUSTODY_SRC_LEDGER_JOURNAL_H_

#include <functional>
#include <utility>
#include <vector>

namespace custody::ledger {
    /// Undo log of the operations in progress. Every change to ledger
    /// state records how to revert itself, so rolling back an operation
    /// costs time proportional to the entries it touched. Records refer
    /// to the containers they modify, which must not move while records
    /// are pending.
    class journal {
      public:
        /// Reverts one change.
        using undo_type = std::function<void()>;

        /// Appends an undo record.
        void record(undo_type undo);

        /// Returns a position that rollback() can return to.
        [[nodiscard]] auto mark() const -> size_t;

        /// Runs the records newer than the mark, newest first, and drops
        /// them.
        /// \param mark position returned by mark().
        void rollback(size_t mark);

        /// Drops every record, making all changes permanent.
        void commit();

        /// Assigns a value, recording the previous one.
        template<typename T>
        void assign(T& target, T value) {
            record([&target, old = target]() {
                target = old;
            });
            target = std::move(value);
        }

        /// Sets a map entry, recording the previous entry or its absence.
        template<typename Map>
        void put(Map& map,
                 const typename Map::key_type& key,
                 typename Map::mapped_type value) {
            auto it = map.find(key);
            if(it == map.end()) {
                record([&map, key]() {
                    map.erase(key);
                });
                map.emplace(key, std::move(value));
                return;
            }
            record([&map, key, old = it->second]() {
                map.insert_or_assign(key, old);
            });
            it->second = std::move(value);
        }

        /// Removes a map entry if present, recording it.
        template<typename Map>
        void remove(Map& map, const typename Map::key_type& key) {
            auto it = map.find(key);
            if(it == map.end()) {
                return;
            }
            record([&map, key, old = it->second]() {
                map.insert_or_assign(key, old);
            });
            map.erase(it);
        }

        /// Inserts into a set.
        /// \return true if the value was not already present.
        template<typename Set>
        auto insert(Set& set, const typename Set::value_type& value)
            -> bool {
            if(!set.insert(value).second) {
                return false;
            }
            record([&set, value]() {
                set.erase(value);
            });
            return true;
        }

        /// Erases from a set.
        /// \return true if the value was present.
        template<typename Set>
        auto erase(Set& set, const typename Set::value_type& value) -> bool {
            if(set.erase(value) == 0) {
                return false;
            }
            record([&set, value]() {
                set.insert(value);
            });
            return true;
        }

      private:
        std::vector<undo_type> m_undo;
    };
}

#endif
