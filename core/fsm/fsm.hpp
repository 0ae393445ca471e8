/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_DATASPACE_CORE_FSM_FSM_HPP
#define CPP_DATASPACE_CORE_FSM_FSM_HPP

#include <functional>
#include <memory>
#include <set>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

#include "common/outcome.hpp"
#include "fsm/error.hpp"
#include "fsm/type_hashers.hpp"

/**
 * The namespace is related to a generic implementation of a finite state
 * machine
 */
namespace ds::fsm {
  using ds::common::EnumClassHash;

  /**
   * Container for state transitions caused by an event
   *
   * Initialization methods of the class could arise exceptions.
   * This is designed behavior due to the nature of further way of use.
   *
   * Initialization has to be done via
   * sequential calling from* and to* methods.
   *
   * @tparam EventEnumType - enum class with events listed
   * @tparam EventContext - type of data passed along with an event
   * @tparam StateEnumType - enum class with states listed
   * @tparam Entity - type of entity to be tracked. Required for enabling
   * callbacks on transitions
   */
  template <typename EventEnumType,
            typename EventContext,
            typename StateEnumType,
            typename Entity>
  class Transition final {
   public:
    using EntityPtr = std::shared_ptr<Entity>;
    using EventContextPtr = std::shared_ptr<EventContext>;

    /**
     * Type alias for callback on state transition if set. A failed action
     * cancels the transition.
     */
    using ActionFunction = std::function<outcome::result<void>(
        EntityPtr /* pointer to tracked entity */,
        EventEnumType /* event that caused state transition */,
        EventContextPtr /* data passed along with the event */,
        StateEnumType /* transition source state */,
        StateEnumType /* transition destination state */)>;

    /// Constructs transition map container for the \param event
    explicit Transition(EventEnumType event) : event_{event}, from_any_{false} {}

    /// Set source state for a transition
    Transition &from(StateEnumType from_state) {
      if (from_any_ or not intermediary_.empty()) {
        throw std::runtime_error(
            "Event transition source state redefinition or destination state "
            "was not set.");
      }
      intermediary_.insert(from_state);
      return *this;
    }

    /// Set a list of source states for a transition
    template <typename... States>
    Transition &fromMany(States... states) {
      if (from_any_ or not intermediary_.empty()) {
        throw std::runtime_error(
            "Event transition source state redefinition or destination state "
            "was not set.");
      }
      (intermediary_.insert(states), ...);
      return *this;
    }

    /// Enable transition from any state
    Transition &fromAny() {
      if (not transitions_.empty()) {
        throw std::runtime_error(
            "Event transition source state redefinition or destination state "
            "was not set.");
      }
      from_any_ = true;
      return *this;
    }

    /// Set destination state of a transition
    Transition &to(StateEnumType to_state) {
      if (from_any_) {
        if (not intermediary_.empty()) {
          throw std::runtime_error(
              "Event transition destination state redefinition.");
        }
        intermediary_.insert(to_state);
        return *this;
      }
      if (intermediary_.empty()) {
        throw std::runtime_error(
            "Event transition source state(s) are not set.");
      }
      for (auto from : intermediary_) {
        if (transitions_.end() != transitions_.find(from)) {
          throw std::runtime_error(
              "Event transition source state redefinition or "
              "destination state was not set.");
        }
        transitions_[from] = to_state;
      }
      intermediary_.clear();
      return *this;
    }

    /// Set destination state of transition equal to the source state
    Transition &toSameState() {
      if (1 != intermediary_.size()) {
        throw std::runtime_error(
            "Exactly one source state has to be set prior to instantiation of "
            "the same state transition.");
      }
      return to(*intermediary_.begin());
    }

    /**
     * Set a callback to be called when state transition happens
     * @param callback - a function that takes five arguments:
     * 1. a shared pointer to an entity
     * 2. event that triggered the transition
     * 3. event context
     * 4. transition source state
     * 5. transition destination state
     * @return self
     */
    Transition &action(ActionFunction callback) {
      if (transition_action_) {
        throw std::runtime_error("Transition callback is already set.");
      }
      transition_action_ = std::move(callback);
      return *this;
    }

    /// Getter for event identifier
    EventEnumType eventId() const {
      return event_;
    }

    /**
     * Lookups if there is a transition for a given source state.
     * @param from_state - transition source state
     * @return resulting state if there is a transition rule
     */
    boost::optional<StateEnumType> target(StateEnumType from_state) const {
      if (from_any_) {
        if (1 != intermediary_.size()) {
          throw std::runtime_error(
              "Use of semi-initialized event transition rule");
        }
        return *intermediary_.begin();
      }
      auto lookup = transitions_.find(from_state);
      if (transitions_.end() == lookup) {
        return boost::none;
      }
      return lookup->second;
    }

    /**
     * Runs transition callback if set.
     *
     * This method is designed for use by FSM class only.
     */
    outcome::result<void> apply(const EntityPtr &entity_ptr,
                                const EventContextPtr &context,
                                StateEnumType from_state,
                                StateEnumType to_state) const {
      if (transition_action_) {
        return transition_action_.get()(
            entity_ptr, event_, context, from_state, to_state);
      }
      return outcome::success();
    }

   private:
    EventEnumType event_;
    bool from_any_;
    std::unordered_map<StateEnumType, StateEnumType, EnumClassHash>
        transitions_;
    std::set<StateEnumType> intermediary_;
    boost::optional<ActionFunction> transition_action_;
  };

  /**
   * Finite State Machine implementation.
   *
   * The machine does not own entity states: every entity carries its own
   * `state` member which is updated by dispatch() after the transition action
   * succeeded. Persisting the entity is up to the caller.
   *
   * @tparam EventEnumType - enum class with list of events
   * @tparam EventContext - type of data passed along with an event
   * @tparam StateEnumType - enum class with list of states
   * @tparam Entity - type of handled objects, actually std::shared_ptr<Entity>
   */
  template <typename EventEnumType,
            typename EventContext,
            typename StateEnumType,
            typename Entity>
  class FSM {
   public:
    using EntityPtr = std::shared_ptr<Entity>;
    using EventContextPtr = std::shared_ptr<EventContext>;
    using TransitionRule =
        Transition<EventEnumType, EventContext, StateEnumType, Entity>;
    using AnyChangeFunction = std::function<void(
        EntityPtr /* pointer to tracked entity */,
        EventEnumType /* event that caused state transition */,
        StateEnumType /* transition source state */,
        StateEnumType /* transition destination state */)>;

    /**
     * Creates a state machine
     * @param transition_rules - defines state transitions, an event may be
     * used by several rules with different source states
     */
    explicit FSM(std::vector<TransitionRule> transition_rules) {
      for (auto &rule : transition_rules) {
        auto event = rule.eventId();
        transitions_[event].push_back(std::move(rule));
      }
    }

    /**
     * Checks whether the event is applicable to an entity in the state
     * @param from_state - current entity state
     * @param event - event of interest
     */
    bool accepts(StateEnumType from_state, EventEnumType event) const {
      return findRule(from_state, event) != nullptr;
    }

    /**
     * Applies event to the entity synchronously.
     * @param entity_ptr - entity, its `state` is the transition source
     * @param event - event to apply
     * @param context - optional data used by transition action
     * @return destination state or kInvalidTransition if no rule matches, or
     * error of transition action. Entity state is not changed on error.
     */
    outcome::result<StateEnumType> dispatch(const EntityPtr &entity_ptr,
                                            EventEnumType event,
                                            EventContextPtr context = {}) const {
      const auto source_state = entity_ptr->state;
      const auto *rule = findRule(source_state, event);
      if (rule == nullptr) {
        return FsmError::kInvalidTransition;
      }
      const auto resulting_state = rule->target(source_state).get();
      OUTCOME_TRY(
          rule->apply(entity_ptr, context, source_state, resulting_state));
      entity_ptr->state = resulting_state;
      if (any_change_cb_) {
        any_change_cb_.get()(entity_ptr, event, source_state, resulting_state);
      }
      return resulting_state;
    }

    /**
     * Optional. Sets a callback to call on any state transition.
     *
     * It will be called after a specific for the transition callback (if it was
     * set) succeeded.
     */
    void setAnyChangeAction(AnyChangeFunction action) {
      any_change_cb_ = std::move(action);
    }

   private:
    const TransitionRule *findRule(StateEnumType from_state,
                                   EventEnumType event) const {
      auto event_handler = transitions_.find(event);
      if (transitions_.end() == event_handler) {
        return nullptr;
      }
      for (const auto &rule : event_handler->second) {
        if (rule.target(from_state)) {
          return &rule;
        }
      }
      return nullptr;
    }

    /// a dispatching list of events and what to do on event
    std::unordered_map<EventEnumType,
                       std::vector<TransitionRule>,
                       EnumClassHash>
        transitions_;

    /// optional callback for any transition
    boost::optional<AnyChangeFunction> any_change_cb_;
  };

}  // namespace ds::fsm

#endif  // CPP_DATASPACE_CORE_FSM_FSM_HPP
