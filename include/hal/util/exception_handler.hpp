#pragma once

namespace hal::util {

/**
 * A Lippincott function for DRY, centralized exception handling.
 * See https://www.youtube.com/watch?v=-amJL3AyADI for background on this
 * design pattern.
 *
 * Alerts the user what went wrong, then causes the program to exit. Intended for the outermost
 * frame of main() and of every thread the library starts.
 */
[[noreturn]] void exception_handler() noexcept;

} /* namespace hal::util */
