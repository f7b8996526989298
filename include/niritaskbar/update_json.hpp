#pragma once

#include <string>

#include "niritaskbar/config.hpp"
#include "niritaskbar/output_filter.hpp"
#include "niritaskbar/taskbar.hpp"

namespace niritaskbar {

    // One JSON document per update, without a trailing newline.
    //
    // Snapshot: {"type":"snapshot","windows":[...],"workspaces":[...]}
    // Urgency:  {"type":"urgency","id":N,"urgent":bool}
    std::string render_update_json(const TaskbarUpdate& update, const Config& config, const OutputFilter& filter);

} // namespace niritaskbar
