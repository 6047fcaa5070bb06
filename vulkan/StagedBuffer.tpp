// StagedBuffer.tpp - template implementations for StagedBuffer<T>

#ifndef VULKAN_STAGED_BUFFER_TPP
#define VULKAN_STAGED_BUFFER_TPP

#include <algorithm>

template <typename T>
StagedBuffer<T>::StagedBuffer(GraphicsContext& context, size_t initialCount, VkBufferUsageFlags usage)
    : context(context), usage(usage | VK_BUFFER_USAGE_TRANSFER_DST_BIT) {
    // zero-sized buffers are not allowed, keep room for at least one record
    size_t count = std::max<size_t>(initialCount, 1);
    records.reserve(count);
    buffer = context.createBuffer(static_cast<VkDeviceSize>(count * sizeof(T)), this->usage);
}

template <typename T>
StagedBuffer<T>::~StagedBuffer() {
    if (buffer.buffer != VK_NULL_HANDLE) context.destroyBuffer(buffer);
}

template <typename T>
StagedBuffer<T> StagedBuffer<T>::withCapacity(GraphicsContext& context, size_t initialCount, VkBufferUsageFlags usage) {
    return StagedBuffer<T>(context, initialCount, usage);
}

template <typename T>
typename StagedBuffer<T>::Batch StagedBuffer<T>::beginBatch() {
    if (batchOpen) {
        throw std::logic_error("staged buffer already has an open batch");
    }
    batchOpen = true;
    return Batch(this, records.size());
}

template <typename T>
void StagedBuffer<T>::clear() {
    if (batchOpen) {
        throw std::logic_error("cannot clear a staged buffer while a batch is open");
    }
    records.clear();
}

template <typename T>
void StagedBuffer<T>::flush(size_t start) {
    if (records.empty()) return;

    VkDeviceSize required = static_cast<VkDeviceSize>(records.size() * sizeof(T));
    if (required > buffer.size) {
        // grow to exactly fit and upload the whole sequence in one transfer
        context.destroyBuffer(buffer);
        buffer = context.createBuffer(required, usage);
        context.writeBuffer(buffer, 0, records.data(), required);
        return;
    }

    if (start >= records.size()) return;

    VkDeviceSize offset = static_cast<VkDeviceSize>(start * sizeof(T));
    context.writeBuffer(buffer, offset, records.data() + start, required - offset);
}

template <typename T>
StagedBuffer<T>::Batch::Batch(StagedBuffer<T>* owner, size_t start) : owner(owner), start(start) {}

template <typename T>
StagedBuffer<T>::Batch::Batch(Batch&& other) noexcept : owner(other.owner), start(other.start) {
    other.owner = nullptr;
}

template <typename T>
StagedBuffer<T>::Batch::~Batch() {
    // a growth failure here terminates the process
    close();
}

template <typename T>
void StagedBuffer<T>::Batch::push(const T& record) {
    if (!owner) {
        throw std::logic_error("push on a closed batch");
    }
    owner->records.push_back(record);
}

template <typename T>
void StagedBuffer<T>::Batch::close() {
    if (!owner) return;
    StagedBuffer<T>* target = owner;
    owner = nullptr;
    target->batchOpen = false;
    target->flush(start);
}

#endif // VULKAN_STAGED_BUFFER_TPP
