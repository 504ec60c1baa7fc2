#pragma once

#include <string>

#include <rclcpp/rclcpp.hpp>

// ------------------------------------------------------------
// Compile-time switch
// ------------------------------------------------------------
// Comment out to demote pipeline chatter to DEBUG
#define HGP_LOG_INFO

namespace hgp
{

inline rclcpp::Logger make_child_logger(
  rclcpp::Logger parent,
  const std::string & child)
{
  return parent.get_child(child);
}

}  // namespace hgp

// ------------------------------------------------------------
// Logging macros
// ------------------------------------------------------------
#ifdef HGP_LOG_INFO
  #define HGP_LOG(logger, ...) \
  RCLCPP_INFO(logger, __VA_ARGS__)
#else
  #define HGP_LOG(logger, ...) \
  RCLCPP_DEBUG(logger, __VA_ARGS__)
#endif

#define HGP_LOG_DEBUG(logger, ...) \
  RCLCPP_DEBUG(logger, __VA_ARGS__)

#define HGP_LOG_WARN(logger, ...) \
  RCLCPP_WARN(logger, __VA_ARGS__)
