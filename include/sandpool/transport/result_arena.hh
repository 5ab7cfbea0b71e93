#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <sandpool/execution.hh>
#include <sandpool/file_descriptor.hh>
#include <string_view>
#include <vector>

namespace sandpool::arena {

enum class SlotState : uint32_t {
    FREE = 0,
    RESERVED = 1,
    WRITTEN = 2,
    CONSUMED = 3,
};

[[nodiscard]] const char* to_str(SlotState state) noexcept;

constexpr uint32_t STDOUT_TRUNCATED = 1;
constexpr uint32_t STDERR_TRUNCATED = 2;

// Lives at the beginning of every slot. Only the fields below state are written by the worker.
struct SlotHeader {
    std::atomic<uint32_t> state;
    uint32_t request_capacity;
    uint32_t output_capacity;
    uint32_t request_len;
    uint64_t correlation_id;
    uint32_t stdout_len;
    uint32_t stderr_len;
    uint32_t flags;
};

static_assert(std::atomic<uint32_t>::is_always_lock_free);

// Slot: header | request area | stdout area | stderr area, rounded up to the page size
struct SlotLayout {
    static constexpr size_t header_size = 64;
    static_assert(sizeof(SlotHeader) <= header_size);

    uint32_t request_capacity;
    uint32_t output_capacity;

    [[nodiscard]] static size_t request_offset() noexcept { return header_size; }

    [[nodiscard]] size_t stdout_offset() const noexcept {
        return request_offset() + request_capacity;
    }

    [[nodiscard]] size_t stderr_offset() const noexcept { return stdout_offset() + output_capacity; }

    [[nodiscard]] size_t slot_size() const noexcept;
};

// Memory mapping of a single slot descriptor
class MappedSlot {
    void* mem_ = nullptr;
    size_t size_ = 0;
    bool writable_ = false;

public:
    // Maps the whole memfd @p fd, throws upon error
    MappedSlot(int fd, bool writable);

    MappedSlot(const MappedSlot&) = delete;
    MappedSlot& operator=(const MappedSlot&) = delete;
    MappedSlot(MappedSlot&& other) noexcept;
    MappedSlot& operator=(MappedSlot&& other) noexcept;

    ~MappedSlot();

    [[nodiscard]] size_t size() const noexcept { return size_; }

    [[nodiscard]] bool writable() const noexcept { return writable_; }

    [[nodiscard]] SlotHeader& header() const noexcept { return *static_cast<SlotHeader*>(mem_); }

    [[nodiscard]] std::byte* data() const noexcept { return static_cast<std::byte*>(mem_); }

    // Returns [offset, offset + len) or throws ProtocolError if it exceeds the mapping
    [[nodiscard]] std::string_view view(size_t offset, size_t len) const;

    // Layout as declared by the header, throws ProtocolError if it does not fit the mapping
    [[nodiscard]] SlotLayout layout() const;
};

// Worker side: fills a slot reserved for one job
class SlotWriter {
    MappedSlot& slot_;
    SlotLayout layout_;
    uint32_t stdout_len_ = 0;
    uint32_t stderr_len_ = 0;
    uint32_t flags_ = 0;

    static void append(
        std::byte* area, uint32_t capacity, uint32_t& len, uint32_t& flags, uint32_t truncated_flag,
        std::string_view data
    ) noexcept;

public:
    // Throws ProtocolError unless the slot is RESERVED for @p correlation_id
    SlotWriter(MappedSlot& slot, CorrelationId correlation_id);

    [[nodiscard]] std::string_view request() const;

    // Output above the capacity is dropped and marks the stream as truncated
    void append_stdout(std::string_view data) noexcept;
    void append_stderr(std::string_view data) noexcept;

    // Publishes lengths and moves the slot RESERVED -> WRITTEN, throws ProtocolError on failure
    void finish();
};

struct SlotOutputs {
    OutputRef stdout_ref;
    OutputRef stderr_ref;
};

// Daemon side owner of all slots
class ResultArena {
    struct Slot {
        FileDescriptor memfd;
        MappedSlot mapping;
    };

    SlotLayout layout_;
    size_t slot_size_;
    std::vector<Slot> slots_;
    std::atomic<uint32_t> next_hint_{0};

    [[nodiscard]] SlotHeader& header(uint32_t slot) const noexcept {
        return slots_[slot].mapping.header();
    }

    void check_index(uint32_t slot) const;

    bool transition(uint32_t slot, SlotState from, SlotState to) noexcept;

public:
    // Creates @p slots_num sealed memfds, throws upon error
    ResultArena(uint32_t slots_num, SlotLayout layout);

    ResultArena(const ResultArena&) = delete;
    ResultArena(ResultArena&&) = delete;
    ResultArena& operator=(const ResultArena&) = delete;
    ResultArena& operator=(ResultArena&&) = delete;

    ~ResultArena() = default;

    [[nodiscard]] size_t slots_num() const noexcept { return slots_.size(); }

    [[nodiscard]] const SlotLayout& layout() const noexcept { return layout_; }

    [[nodiscard]] size_t slot_size() const noexcept { return slot_size_; }

    // Moves a FREE slot to RESERVED for @p correlation_id and clears it, std::nullopt if none is
    // free
    [[nodiscard]] std::optional<uint32_t> reserve(CorrelationId correlation_id);

    // Copies @p code into the request area of a RESERVED slot, throws if it does not fit
    void write_request(uint32_t slot, std::string_view code);

    // Whether the slot is WRITTEN for @p correlation_id with lengths within capacity
    [[nodiscard]] bool is_written_by(uint32_t slot, CorrelationId correlation_id) const;

    [[nodiscard]] SlotOutputs outputs(uint32_t slot) const;

    // WRITTEN -> CONSUMED, false if the slot is not WRITTEN for @p correlation_id
    bool mark_consumed(uint32_t slot, CorrelationId correlation_id);

    // WRITTEN | CONSUMED -> FREE, false if the slot does not hold @p correlation_id's result
    bool release(uint32_t slot, CorrelationId correlation_id);

    // Forces the slot to FREE, only after the worker that could write to it is gone
    void reclaim(uint32_t slot) noexcept;

    [[nodiscard]] SlotState state(uint32_t slot) const;

    [[nodiscard]] size_t free_slots_num() const noexcept;

    // Read-write descriptor handed to the worker executing the job
    [[nodiscard]] int fd(uint32_t slot) const;

    // Copy of @p slot in a new memfd sealed against writes, handed to the client. The copy does
    // not follow later reuse of the slot.
    [[nodiscard]] FileDescriptor sealed_copy_fd(uint32_t slot) const;

    [[nodiscard]] std::string_view stdout_data(uint32_t slot) const;
    [[nodiscard]] std::string_view stderr_data(uint32_t slot) const;
};

} // namespace sandpool::arena
