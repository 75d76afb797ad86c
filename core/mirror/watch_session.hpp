// ==============================================================================
// Watch Session
// ==============================================================================
// State of one debugger watch window: the symbols evaluated for it and the
// values they produced. Each debug session owns its own WatchSession, so
// sessions never see each other's watch results.
// ==============================================================================

#ifndef DSMIRROR_MIRROR_WATCH_SESSION_HPP
#define DSMIRROR_MIRROR_WATCH_SESSION_HPP

#include "stack_value.hpp"
#include "symbol_node.hpp"
#include <string>
#include <vector>

namespace dsm {

class Executive;

struct WatchSession {
    std::vector<SymbolNode> watch_symbols;
    std::vector<StackValue> watch_stack;

    /**
     * @brief Record a watched symbol and its value
     *
     * The symbol's storage_index is set to the value's slot in watch_stack.
     */
    void push(const SymbolNode& symbol, const StackValue& value);

    /**
     * @brief Evaluate a watch expression in the executive's running block
     *
     * The result is recorded under the watch-result name, where
     * ExecutionMirror::get_watch_value() picks it up.
     *
     * @throws ParseError if the expression is malformed
     * @throws RuntimeError if evaluation fails
     */
    void evaluate(Executive& executive, const std::string& expression);

    /**
     * @brief Forget every watched symbol and value
     */
    void clear() {
        watch_symbols.clear();
        watch_stack.clear();
    }
};

}  // namespace dsm

#endif  // DSMIRROR_MIRROR_WATCH_SESSION_HPP
