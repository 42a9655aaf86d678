#pragma once

#include <memory>
#include <string>
#include <vector>

namespace domo_nlu {

/**
 * @brief Per-request interpretation state
 */
enum class InterpretationState {
    RuleAttempt,        ///< Running normalizer / negation / intent / entity stages
    FallbackDelegated,  ///< Waiting on the fallback interpreter
    Resolved            ///< Terminal
};

const char* to_string(InterpretationState state);

/**
 * @brief State machine for one interpretation request
 *
 * - RuleAttempt -> Resolved (on_gate_passed, or on_gate_failed without a fallback)
 * - RuleAttempt -> FallbackDelegated (on_gate_failed with a fallback)
 * - FallbackDelegated -> Resolved (on_fallback_answered / on_fallback_failed)
 *
 * Events that do not apply to the current state are ignored. Not thread-safe;
 * each request owns its own instance.
 */
class InterpretationStateMachine {
public:
    InterpretationStateMachine();
    ~InterpretationStateMachine();

    InterpretationState get_state() const;

    void on_gate_passed();

    /**
     * @param fallback_available True when a fallback will be consulted
     */
    void on_gate_failed(bool fallback_available);

    void on_fallback_answered();
    void on_fallback_failed();

    bool is_resolved() const;

    /**
     * @brief States visited in order, starting with RuleAttempt
     */
    std::vector<InterpretationState> history() const;

    /// "rule_attempt -> fallback_delegated -> resolved"
    std::string history_string() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace domo_nlu
