#pragma once

namespace hal {
/**
 * Entry point of the demo application. Placed in the hal namespace for convenience.
 */
int hal_main(const int argc, const char **argv);
}  // namespace hal

/**
 * Global entry point. Simply calls hal_main()
 */
int main(const int argc, const char **argv);
