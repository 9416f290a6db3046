#pragma once

#include <string>

#include "mmdv/core/Observable.hpp"

namespace mmdv::ui
{
    // On-screen "enter VR" control. Drawn by the overlay while visible.
    struct EnterVrButton
    {
        std::string label = "VR Mode";
        bool visible = true;
        core::Observable<> onClick;

        void click() { onClick.notify(); }
    };
}
