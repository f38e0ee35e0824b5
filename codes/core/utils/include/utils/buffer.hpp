// =============================================================================
//  HTTP Mock Server - Utils Module
//  文件: buffer.hpp
//  描述: 动态缓冲区类定义（连接读缓冲）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace http_mock_server {
namespace utils {

/**
 * @brief 动态缓冲区类
 * @note 线程安全说明：Buffer 类不是线程安全的。每个连接独占一个 Buffer，
 *       由处理该连接的工作线程访问。
 */
class Buffer {
public:
    static constexpr size_t DEFAULT_INITIAL_CAPACITY = 8192;  // 默认初始容量
    static constexpr size_t MIN_CAPACITY = 1024;              // 最小容量
    static constexpr size_t MAX_CAPACITY = 64 * 1024 * 1024;  // 最大容量
    static constexpr size_t GROWTH_THRESHOLD_DOUBLE = 64 * 1024;  // 翻倍扩容阈值
    static constexpr size_t GROWTH_THRESHOLD_15X = 1024 * 1024;   // 1.5倍扩容阈值
    static constexpr size_t GROWTH_LINEAR_INCREMENT = 256 * 1024;  // 线性扩容增量

    // 构造函数
    // initial_capacity: 初始容量，默认8KB
    explicit Buffer(size_t initial_capacity = DEFAULT_INITIAL_CAPACITY);

    ~Buffer();

    // 禁止拷贝
    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    // 支持移动
    Buffer(Buffer&& other) noexcept;
    Buffer& operator=(Buffer&& other) noexcept;

    // ========== 写入方法 ==========

    // 写入数据，返回实际写入的字节数
    // 会自动扩容，超过MAX_CAPACITY时返回0
    size_t write(const uint8_t* data, size_t len);
    size_t write(const char* data, size_t len);

    size_t write(const std::string& str) {
        return write(str.data(), str.size());
    }

    // 预留可写空间，返回指向该空间的指针（用于recv直接写入）
    uint8_t* reserve(size_t len);

    // 提交已写入的数据（配合reserve使用）
    void commit(size_t len);

    // ========== 读取方法 ==========

    // 读取数据，返回实际读取的字节数，移动读指针
    size_t read(uint8_t* data, size_t len);

    // 读取len字节追加到out尾部，返回实际读取字节数
    size_t read_append(std::vector<uint8_t>* out, size_t len);

    // ========== 指针操作 ==========

    const uint8_t* read_ptr() const;

    // 跳过数据（移动读指针）
    void skip(size_t len);

    // ========== 容量管理 ==========

    size_t readable_bytes() const;
    size_t writable_bytes() const;
    size_t capacity() const;

    // 确保有足够的可写空间，必要时扩容
    // return: true-成功，false-失败（超过MAX_CAPACITY）
    bool ensure_writable(size_t len);

    // ========== 清理操作 ==========

    // 清空缓冲区（不释放内存）
    void clear();

    // 压缩空间（将可读数据移到开头，回收空间）
    void compact();

private:
    uint8_t* write_ptr();

    // 计算扩容后的容量，不超过MAX_CAPACITY
    size_t calculate_growth(size_t required) const;

    bool resize(size_t new_capacity);

    std::vector<uint8_t> data_;
    size_t read_idx_;
    size_t write_idx_;
};

} // namespace utils
} // namespace http_mock_server
