#include "sandbox/stream_demuxer.hpp"
#include <algorithm>

namespace arena::sandbox {
using namespace std;

const char *TRUNCATION_MARKER = "\n... (truncated)";

output_buffer::output_buffer(size_t limit)
    : limit(limit), total(0) {}

void output_buffer::append(const char *data, size_t size) {
    total += size;
    if (content.size() < limit)
        content.append(data, min(size, limit - content.size()));
}

bool output_buffer::truncated() const {
    return total > limit;
}

size_t output_buffer::total_size() const {
    return total;
}

string output_buffer::str() const {
    if (truncated()) return content + TRUNCATION_MARKER;
    return content;
}

stream_demuxer::stream_demuxer(output_buffer &out, output_buffer &err)
    : out(out), err(err), header_size(0), current_stream(0), remaining(0) {}

void stream_demuxer::feed(const char *data, size_t size) {
    while (size > 0) {
        if (remaining == 0) {
            // 读取帧头
            size_t need = min(sizeof(header) - header_size, size);
            copy(data, data + need, header + header_size);
            header_size += need;
            data += need, size -= need;
            if (header_size < sizeof(header)) return;

            current_stream = header[0];
            remaining = ((uint32_t)header[4] << 24) | ((uint32_t)header[5] << 16) |
                        ((uint32_t)header[6] << 8) | (uint32_t)header[7];
            header_size = 0;
            continue;
        }

        size_t chunk = min<size_t>(remaining, size);
        // stdin 帧（类型 0）不会出现在日志中，按 stdout 处理
        if (current_stream == 2)
            err.append(data, chunk);
        else
            out.append(data, chunk);
        data += chunk, size -= chunk;
        remaining -= chunk;
    }
}

bool stream_demuxer::incomplete() const {
    return header_size > 0 || remaining > 0;
}

}  // namespace arena::sandbox
