/**
 * ============================================================================
 * PCASH: PLASMA CASH NODE HOST
 * MODULE: CommandProcessor.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Applies JSON command lines to a TokenLedger, one at a time, in input
 * order. The caller identity carried in each command is taken as already
 * authenticated; authenticating it is the transport's job.
 * * COMMANDS:
 *   {"op":"deposit",  "caller":<acct>, "txn":<txn>}
 *   {"op":"transfer", "caller":<acct>, "txn":<txn>}
 *   {"op":"withdraw", "caller":<acct>, "token_id":<id>}
 *   {"op":"query",    "token_id":<id>}
 *   {"op":"classify", "a":<txn>, "b":<txn>}
 * * REPLIES:
 *   {"status":"SUCCESS", ...} or {"status":"ERROR","code":...,"message":...}
 * ============================================================================
 */

#ifndef PCASH_COMMAND_PROCESSOR_HPP
#define PCASH_COMMAND_PROCESSOR_HPP

#include <istream>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "EffectDispatcher.hpp"
#include "../core/ledger.hpp"

using json = nlohmann::json;

namespace pcash {
namespace host {

    class CommandProcessor {
    public:
        CommandProcessor(TokenLedger& ledger, EffectDispatcher& dispatcher)
            : ledger_(ledger), dispatcher_(dispatcher) {}

        /**
         * @brief Runs one command. Rejections come back as ERROR replies,
         * never as exceptions.
         */
        json Execute(const json& command);

        // Parses and runs one line of input.
        json ExecuteLine(const std::string& line);

        /**
         * @brief Reads commands line by line until EOF, writing one reply
         * per non-blank line.
         * @return Number of commands that were rejected.
         */
        size_t Run(std::istream& in, std::ostream& out);

        size_t AcceptedCount() const { return accepted_; }
        size_t RejectedCount() const { return rejected_; }

    private:
        TokenLedger& ledger_;
        EffectDispatcher& dispatcher_;
        size_t accepted_ = 0;
        size_t rejected_ = 0;

        json Dispatch(const json& command);
        json Commit(const TokenEffect& effect);
    };

} // namespace host
} // namespace pcash

#endif // PCASH_COMMAND_PROCESSOR_HPP
