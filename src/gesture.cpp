#include "hand_gesture_perception/gesture.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace hgp
{

std::string gestureToString(Gesture g)
{
  switch (g) {
    case Gesture::ROCK:
      return "ROCK";
    case Gesture::PAPER:
      return "PAPER";
    case Gesture::SCISSORS:
      return "SCISSORS";
  }
  return "NONE";
}

std::string gestureToString(const MaybeGesture & g)
{
  return g ? gestureToString(*g) : "NONE";
}

std::string pairToString(const GesturePair & p)
{
  return gestureToString(p.first) + "+" + gestureToString(p.second);
}

Gesture gestureFromString(const std::string & s)
{
  const auto first = s.find_first_not_of(" \t\r\n");
  const auto last = s.find_last_not_of(" \t\r\n");

  std::string key;
  if (first != std::string::npos) {
    key = s.substr(first, last - first + 1);
  }

  std::transform(
    key.begin(), key.end(), key.begin(),
    [](unsigned char c) {return static_cast<char>(std::toupper(c));});

  if (key == "ROCK") {
    return Gesture::ROCK;
  }
  if (key == "PAPER") {
    return Gesture::PAPER;
  }
  if (key == "SCISSORS") {
    return Gesture::SCISSORS;
  }

  throw std::invalid_argument("Unknown gesture name: '" + s + "'");
}

GesturePair pairFromString(const std::string & s)
{
  const auto plus = s.find('+');
  if (plus == std::string::npos || s.find('+', plus + 1) != std::string::npos) {
    throw std::invalid_argument(
            "Gesture pair must look like 'ROCK+PAPER', got '" + s + "'");
  }

  return {
    gestureFromString(s.substr(0, plus)),
    gestureFromString(s.substr(plus + 1))
  };
}

}  // namespace hgp
