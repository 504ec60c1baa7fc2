#pragma once

#include <optional>
#include <string>
#include <utility>

namespace hgp
{

enum class Gesture
{
  ROCK,
  PAPER,
  SCISSORS
};

using MaybeGesture = std::optional<Gesture>;

// A fully specified pair (password steps, confirm gesture)
using GesturePair = std::pair<Gesture, Gesture>;

// A pair as observed in one frame; either side may be missing
using ObservedPair = std::pair<MaybeGesture, MaybeGesture>;

std::string gestureToString(Gesture g);
std::string gestureToString(const MaybeGesture & g);   // "NONE" when absent
std::string pairToString(const GesturePair & p);        // "ROCK+PAPER"

// Case-insensitive, surrounding whitespace ignored.
// Throws std::invalid_argument on unknown names.
Gesture gestureFromString(const std::string & s);

// "ROCK+SCISSORS" -> (ROCK, SCISSORS). Throws std::invalid_argument.
GesturePair pairFromString(const std::string & s);

inline ObservedPair toObserved(const GesturePair & p)
{
  return {p.first, p.second};
}

inline bool bothPresent(const ObservedPair & p)
{
  return p.first.has_value() && p.second.has_value();
}

inline bool pairEquals(const ObservedPair & observed, const GesturePair & want)
{
  return bothPresent(observed) &&
         *observed.first == want.first &&
         *observed.second == want.second;
}

}  // namespace hgp
