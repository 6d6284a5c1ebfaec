#include "redirect-event.h"

RedirectEventKind kindOf(const RedirectEvent& event) noexcept {
    switch (event.index())
    {
    case 0: return RedirectEventKind::Captured;
    case 1: return RedirectEventKind::Invalid;
    default: return RedirectEventKind::ListenerFailed;
    }
}

int portOf(const RedirectEvent& event) noexcept {
    return std::visit([](const auto& e) { return e.port; }, event);
}

const char* to_cstr(RedirectEventKind kind) {
    switch (kind)
    {
    case RedirectEventKind::Captured: return "redirect-captured";
    case RedirectEventKind::Invalid: return "redirect-invalid";
    case RedirectEventKind::ListenerFailed: return "listener-failed";
    default: return "unknown";
    }
}
