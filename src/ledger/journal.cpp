// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "journal.hpp"

namespace custody::ledger {
    void journal::record(undo_type undo) {
        m_undo.emplace_back(std::move(undo));
    }

    auto journal::mark() const -> size_t {
        return m_undo.size();
    }

    void journal::rollback(size_t mark) {
        // An undo record may re-enter the ledger through an external
        // call and append records of its own; those are unwound too.
        while(m_undo.size() > mark) {
            auto undo = std::move(m_undo.back());
            m_undo.pop_back();
            undo();
        }
    }

    void journal::commit() {
        m_undo.clear();
    }
}
