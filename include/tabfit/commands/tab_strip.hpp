#pragma once

#include <cstdint>

namespace tabfit::commands
{

inline constexpr std::uint16_t TabNext = 2700;
inline constexpr std::uint16_t TabPrevious = 2701;
inline constexpr std::uint16_t TabNew = 2702;
inline constexpr std::uint16_t TabClose = 2703;
inline constexpr std::uint16_t TabRename = 2704;
inline constexpr std::uint16_t SwitchBuffer = 2705;
inline constexpr std::uint16_t LayoutSettings = 2706;

} // namespace tabfit::commands
