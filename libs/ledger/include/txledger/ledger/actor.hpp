#pragma once

#include <concepts>
#include <span>

namespace txledger {
namespace ledger {

// Handle/apply capability of an event-sourced aggregate: `handle` decides,
// without side effects, which events a command produces; `apply` folds those
// events into state.
template <typename A, typename C, typename E>
concept Actor = requires(A& actor, const A& const_actor, const C& command, std::span<const E> events) {
  { command.actor_id() } -> std::convertible_to<typename A::Id>;
  { const_actor.id() } -> std::convertible_to<typename A::Id>;
  { const_actor.handle(command).accepted() } -> std::convertible_to<bool>;
  { const_actor.handle(command).events } -> std::convertible_to<std::span<const E>>;
  actor.apply(events);
};

}  // namespace ledger
}  // namespace txledger
