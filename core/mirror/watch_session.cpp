// ==============================================================================
// Watch Session Implementation
// ==============================================================================

#include "watch_session.hpp"
#include "executive.hpp"
#include "logger.hpp"
#include "program_loader.hpp"
#include <utility>

namespace dsm {

void WatchSession::push(const SymbolNode& symbol, const StackValue& value) {
    SymbolNode entry = symbol;
    entry.storage_index = static_cast<int>(watch_stack.size());
    watch_symbols.push_back(std::move(entry));
    watch_stack.push_back(value);
}

void WatchSession::evaluate(Executive& executive, const std::string& expression) {
    ExprPtr expr = ProgramLoader::parse_expression(expression, "<watch>");
    int block_id = executive.running_block();
    StackValue value = executive.evaluate(*expr, block_id);

    SymbolNode result(Constants::WATCH_RESULT_VAR,
                      ClassTable::build_primitive_type(PrimitiveType::VAR, 0),
                      Constants::INVALID_INDEX, Constants::GLOBAL_SCOPE, block_id);
    push(result, value);

    log_debug("Watch '{}' in block {} -> {}", expression, block_id,
              stack_value_to_string(value));
}

}  // namespace dsm
