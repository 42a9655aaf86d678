#include "interpretation_state.h"

namespace domo_nlu {

const char* to_string(InterpretationState state) {
    switch (state) {
        case InterpretationState::RuleAttempt:       return "rule_attempt";
        case InterpretationState::FallbackDelegated: return "fallback_delegated";
        case InterpretationState::Resolved:          return "resolved";
    }
    return "resolved";
}

class InterpretationStateMachine::Impl {
public:
    Impl() : state_(InterpretationState::RuleAttempt) {
        history_.push_back(state_);
    }

    InterpretationState get_state() const {
        return state_;
    }

    void on_gate_passed() {
        if (state_ == InterpretationState::RuleAttempt) {
            transition(InterpretationState::Resolved);
        }
    }

    void on_gate_failed(bool fallback_available) {
        if (state_ != InterpretationState::RuleAttempt) {
            return;
        }
        transition(fallback_available ? InterpretationState::FallbackDelegated
                                      : InterpretationState::Resolved);
    }

    void on_fallback_finished() {
        if (state_ == InterpretationState::FallbackDelegated) {
            transition(InterpretationState::Resolved);
        }
    }

    const std::vector<InterpretationState>& history() const {
        return history_;
    }

private:
    InterpretationState state_;
    std::vector<InterpretationState> history_;

    void transition(InterpretationState next) {
        state_ = next;
        history_.push_back(next);
    }
};

InterpretationStateMachine::InterpretationStateMachine() : pimpl_(std::make_unique<Impl>()) {}
InterpretationStateMachine::~InterpretationStateMachine() = default;

InterpretationState InterpretationStateMachine::get_state() const {
    return pimpl_->get_state();
}

void InterpretationStateMachine::on_gate_passed() {
    pimpl_->on_gate_passed();
}

void InterpretationStateMachine::on_gate_failed(bool fallback_available) {
    pimpl_->on_gate_failed(fallback_available);
}

void InterpretationStateMachine::on_fallback_answered() {
    pimpl_->on_fallback_finished();
}

void InterpretationStateMachine::on_fallback_failed() {
    pimpl_->on_fallback_finished();
}

bool InterpretationStateMachine::is_resolved() const {
    return pimpl_->get_state() == InterpretationState::Resolved;
}

std::vector<InterpretationState> InterpretationStateMachine::history() const {
    return pimpl_->history();
}

std::string InterpretationStateMachine::history_string() const {
    std::string out;
    for (auto state : pimpl_->history()) {
        if (!out.empty()) out += " -> ";
        out += to_string(state);
    }
    return out;
}

} // namespace domo_nlu
