#pragma once

#include <cstdint>
#include <string>

namespace arena::sandbox {

/**
 * @brief 有上限的输出缓冲区
 * 超出上限的部分会被丢弃（但仍然计数），保证无限的输出不会撑爆内存
 */
class output_buffer {
public:
    explicit output_buffer(size_t limit);

    void append(const char *data, size_t size);

    bool truncated() const;

    /**
     * @brief 收到的总字节数，包括被丢弃的部分
     */
    size_t total_size() const;

    /**
     * @brief 保留的内容，若发生截断则在末尾加上截断标记
     */
    std::string str() const;

private:
    size_t limit;
    size_t total;
    std::string content;
};

/**
 * @brief Docker 多路复用日志流的解码器
 * 
 * 每一帧由 8 字节的头和数据组成：
 * [流类型(1 字节，1 为 stdout，2 为 stderr), 0, 0, 0, 数据长度(4 字节大端序)]
 * 
 * 网络数据块可能在帧的任意位置截断，因此解码器会保存不完整的帧头，
 * 并记住当前帧剩余的数据长度。
 */
class stream_demuxer {
public:
    stream_demuxer(output_buffer &out, output_buffer &err);

    /**
     * @brief 输入一段原始数据
     */
    void feed(const char *data, size_t size);

    /**
     * @brief 流结束时是否还有不完整的帧
     */
    bool incomplete() const;

private:
    output_buffer &out;
    output_buffer &err;

    unsigned char header[8];
    size_t header_size;
    uint8_t current_stream;
    uint32_t remaining;
};

extern const char *TRUNCATION_MARKER;

}  // namespace arena::sandbox
