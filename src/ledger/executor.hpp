// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_EXECUTOR_H_
#define CUSTODY_SRC_LEDGER_EXECUTOR_H_

#include "journal.hpp"
#include "messages.hpp"
#include "util.hpp"
#include "util/common/logging.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace custody::ledger {
    /// Runs ledger operations with all-or-nothing semantics. Changes made
    /// by an operation are recorded in the state's journal and unwound if
    /// the operation fails, together with any events it emitted.
    /// Operations started while another is in progress (through a
    /// re-entrant external call) share the outer operation's journal and
    /// event buffer; both are committed once the outermost operation
    /// succeeds.
    /// \tparam State struct holding all mutable ledger state, with a
    ///               std::shared_ptr<journal> member m_journal that every
    ///               component records its changes in.
    template<typename State>
    class executor {
      public:
        /// Callback receiving published events.
        using event_sink_type = std::function<void(const event&)>;

        /// Operation body. Returns an error code to reject the operation.
        using operation_type = std::function<std::optional<error_code>(
            State& state)>;

        /// Constructor.
        /// \param log log instance.
        /// \param state initial state.
        executor(std::shared_ptr<logging::log> log, State state)
            : m_log(std::move(log)),
              m_state(std::move(state)),
              m_journal(m_state.m_journal) {
            // Changes made while building the initial state are permanent.
            m_journal->commit();
        }

        executor(const executor&) = delete;
        auto operator=(const executor&) -> executor& = delete;
        executor(executor&&) = delete;
        auto operator=(executor&&) -> executor& = delete;

        ~executor() = default;

        /// Executes an operation.
        /// \param name operation name used in log statements.
        /// \param op operation to execute.
        /// \return events emitted by the operation or the reason it was
        ///         rejected.
        auto run(const char* name, const operation_type& op)
            -> exec_return_type {
            const auto journal_mark = m_journal->mark();
            const auto mark = m_pending.size();
            m_depth++;
            auto err = op(m_state);

            if(err.has_value()) {
                // Still nested while unwinding, so operations re-entered
                // from undo records never commit the journal.
                m_journal->rollback(journal_mark);
                m_depth--;
                m_pending.resize(mark);
                m_log->trace(name, "rejected:", to_string(err.value()));
                return err.value();
            }
            m_depth--;

            auto events = std::vector<event>(
                m_pending.begin() + static_cast<std::ptrdiff_t>(mark),
                m_pending.end());
            if(m_depth == 0) {
                m_journal->commit();
                m_pending.clear();
                if(m_sink) {
                    for(const auto& e : events) {
                        m_sink(e);
                    }
                }
            }
            m_log->trace(name, "succeeded with", events.size(), "events");
            return events;
        }

        /// Buffers an event of the operation in progress.
        void emit(event e) {
            m_pending.emplace_back(std::move(e));
        }

        /// Returns the committed state, or the in-progress state during
        /// an operation.
        [[nodiscard]] auto state() const -> const State& {
            return m_state;
        }

        /// Sets the callback receiving published events.
        void set_event_sink(event_sink_type sink) {
            m_sink = std::move(sink);
        }

      private:
        std::shared_ptr<logging::log> m_log;
        State m_state;
        std::shared_ptr<journal> m_journal;
        std::vector<event> m_pending;
        size_t m_depth{0};
        event_sink_type m_sink;
    };
}

#endif
