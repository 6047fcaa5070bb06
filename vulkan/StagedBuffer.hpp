#ifndef VULKAN_STAGED_BUFFER_HPP
#define VULKAN_STAGED_BUFFER_HPP

#include "GraphicsContext.hpp"
#include <vector>
#include <cstddef>
#include <stdexcept>

// GPU buffer mirrored by a host-side sequence of records. The sequence is
// only mutated inside a Batch; closing the batch transfers what changed.
// The GPU allocation never shrinks.
template <typename T>
class StagedBuffer {
public:
    // Write transaction. Only one may be open per buffer; the appended
    // records are flushed when the batch is closed or destroyed.
    class Batch {
    public:
        Batch(Batch&& other) noexcept;
        Batch(const Batch&) = delete;
        Batch& operator=(const Batch&) = delete;
        Batch& operator=(Batch&&) = delete;
        ~Batch();

        void push(const T& record);
        void close();

        bool isOpen() const { return owner != nullptr; }
        size_t getStart() const { return start; }

    private:
        friend class StagedBuffer<T>;
        Batch(StagedBuffer<T>* owner, size_t start);

        StagedBuffer<T>* owner;
        size_t start;
    };

    StagedBuffer(GraphicsContext& context, size_t initialCount, VkBufferUsageFlags usage);
    StagedBuffer(const StagedBuffer&) = delete;
    StagedBuffer& operator=(const StagedBuffer&) = delete;
    ~StagedBuffer();

    static StagedBuffer<T> withCapacity(GraphicsContext& context, size_t initialCount, VkBufferUsageFlags usage);

    Batch beginBatch();

    // Empties the host sequence; the GPU allocation is kept.
    void clear();

    size_t size() const { return records.size(); }
    bool empty() const { return records.empty(); }
    size_t getCapacity() const { return static_cast<size_t>(buffer.size / sizeof(T)); }
    const std::vector<T>& getRecords() const { return records; }
    const Buffer& getBuffer() const { return buffer; }

private:
    void flush(size_t start);

    GraphicsContext& context;
    VkBufferUsageFlags usage;
    std::vector<T> records;
    Buffer buffer;
    bool batchOpen = false;
};

#include "StagedBuffer.tpp"
#endif // VULKAN_STAGED_BUFFER_HPP
