#include "render/renderer.hpp"
#include <cstdio>

namespace asciicam {

std::string format_status(const StatusLine& status) {
    char buf[128];
    snprintf(buf, sizeof(buf), " camera: %s | %.1f fps | %s | color %s | scale %.1f",
             status.camera_state.c_str(), status.fps, status.char_set.c_str(),
             status.color ? "on" : "off", static_cast<double>(status.scale));
    std::string line(buf);
    if (!status.message.empty()) {
        line += " | ";
        line += status.message;
    }
    if (!status.hint.empty()) {
        line += " | ";
        line += status.hint;
    }
    return line;
}

void truncate_to_width(std::string& text, int cols) {
    if (cols <= 0) {
        text.clear();
        return;
    }
    int seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) == 0x80) continue;
        if (seen == cols) {
            text.resize(i);
            return;
        }
        ++seen;
    }
}

}
