#pragma once

#ifdef _WIN32
#include <windows.h>
#else
#include <csignal>
#endif

/**
 * @brief Platform specific process setup
 */
class PlatformUtils {
public:
    static void initialize() {
#ifdef _WIN32
        disableQuickEditMode();
#else
        // A device dropping its socket mid-write must not kill the bridge
        std::signal(SIGPIPE, SIG_IGN);
#endif
    }

private:
#ifdef _WIN32
    /**
     * @brief Disable console quick-edit mode
     * @details A click in the console would otherwise pause the process
     */
    static void disableQuickEditMode() {
        HANDLE hInput = GetStdHandle(STD_INPUT_HANDLE);
        DWORD mode;
        if (GetConsoleMode(hInput, &mode)) {
            mode &= ~ENABLE_QUICK_EDIT_MODE;
            mode |= ENABLE_EXTENDED_FLAGS;
            SetConsoleMode(hInput, mode);
        }
    }
#endif
};
