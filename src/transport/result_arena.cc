#include <algorithm>
#include <cstring>
#include <fcntl.h>
#include <linux/falloc.h>
#include <new>
#include <sandpool/errmsg.hh>
#include <sandpool/errors.hh>
#include <sandpool/macros/throw.hh>
#include <sandpool/transport/result_arena.hh>
#include <sandpool/write_exact.hh>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace sandpool::arena {

const char* to_str(SlotState state) noexcept {
    switch (state) {
    case SlotState::FREE: return "free";
    case SlotState::RESERVED: return "reserved";
    case SlotState::WRITTEN: return "written";
    case SlotState::CONSUMED: return "consumed";
    }
    return "invalid";
}

size_t SlotLayout::slot_size() const noexcept {
    auto page_size = static_cast<size_t>(sysconf(_SC_PAGESIZE));
    auto size = stderr_offset() + output_capacity;
    return (size + page_size - 1) / page_size * page_size;
}

MappedSlot::MappedSlot(int fd, bool writable) : writable_{writable} {
    struct stat64 st;
    if (fstat64(fd, &st)) {
        THROW("fstat()", errmsg());
    }
    if (st.st_size < static_cast<off64_t>(SlotLayout::header_size)) {
        THROW_AS(ProtocolError, "slot is too small: ", st.st_size, " bytes");
    }
    size_ = static_cast<size_t>(st.st_size);
    mem_ = mmap(nullptr, size_, PROT_READ | (writable ? PROT_WRITE : 0), MAP_SHARED, fd, 0);
    if (mem_ == MAP_FAILED) { // NOLINT(performance-no-int-to-ptr)
        mem_ = nullptr;
        THROW("mmap()", errmsg());
    }
}

MappedSlot::MappedSlot(MappedSlot&& other) noexcept
: mem_{std::exchange(other.mem_, nullptr)}
, size_{std::exchange(other.size_, 0)}
, writable_{other.writable_} {}

MappedSlot& MappedSlot::operator=(MappedSlot&& other) noexcept {
    if (this != &other) {
        if (mem_) {
            (void)munmap(mem_, size_);
        }
        mem_ = std::exchange(other.mem_, nullptr);
        size_ = std::exchange(other.size_, 0);
        writable_ = other.writable_;
    }
    return *this;
}

MappedSlot::~MappedSlot() {
    if (mem_) {
        (void)munmap(mem_, size_);
    }
}

std::string_view MappedSlot::view(size_t offset, size_t len) const {
    if (offset > size_ || len > size_ - offset) {
        THROW_AS(ProtocolError, "range [", offset, ", ", offset + len, ") exceeds the slot of size ", size_);
    }
    return {reinterpret_cast<const char*>(data() + offset), len};
}

SlotLayout MappedSlot::layout() const {
    SlotLayout layout{
        .request_capacity = header().request_capacity,
        .output_capacity = header().output_capacity,
    };
    uint64_t end = uint64_t{SlotLayout::header_size} + layout.request_capacity +
        uint64_t{layout.output_capacity} * 2;
    if (end > size_) {
        THROW_AS(ProtocolError, "slot header declares areas beyond the slot size");
    }
    return layout;
}

SlotWriter::SlotWriter(MappedSlot& slot, CorrelationId correlation_id)
: slot_{slot}
, layout_{slot.layout()} {
    if (!slot_.writable()) {
        THROW_AS(ProtocolError, "slot is mapped read-only");
    }
    auto& hdr = slot_.header();
    if (hdr.state.load(std::memory_order_acquire) != static_cast<uint32_t>(SlotState::RESERVED)) {
        THROW_AS(ProtocolError, "slot is not reserved");
    }
    if (hdr.correlation_id != correlation_id) {
        THROW_AS(ProtocolError, "slot is reserved for ", hdr.correlation_id, " not for ", correlation_id);
    }
}

std::string_view SlotWriter::request() const {
    auto len = slot_.header().request_len;
    if (len > layout_.request_capacity) {
        THROW_AS(ProtocolError, "request length exceeds the request area");
    }
    return slot_.view(SlotLayout::request_offset(), len);
}

void SlotWriter::append(
    std::byte* area, uint32_t capacity, uint32_t& len, uint32_t& flags, uint32_t truncated_flag,
    std::string_view data
) noexcept {
    auto n = std::min<size_t>(data.size(), capacity - len);
    std::memcpy(area + len, data.data(), n);
    len += static_cast<uint32_t>(n);
    if (n < data.size()) {
        flags |= truncated_flag;
    }
}

void SlotWriter::append_stdout(std::string_view data) noexcept {
    append(
        slot_.data() + layout_.stdout_offset(),
        layout_.output_capacity,
        stdout_len_,
        flags_,
        STDOUT_TRUNCATED,
        data
    );
}

void SlotWriter::append_stderr(std::string_view data) noexcept {
    append(
        slot_.data() + layout_.stderr_offset(),
        layout_.output_capacity,
        stderr_len_,
        flags_,
        STDERR_TRUNCATED,
        data
    );
}

void SlotWriter::finish() {
    auto& hdr = slot_.header();
    hdr.stdout_len = stdout_len_;
    hdr.stderr_len = stderr_len_;
    hdr.flags = flags_;
    auto expected = static_cast<uint32_t>(SlotState::RESERVED);
    if (!hdr.state.compare_exchange_strong(
            expected, static_cast<uint32_t>(SlotState::WRITTEN), std::memory_order_acq_rel
        ))
    {
        THROW_AS(ProtocolError, "slot is no longer reserved, its state: ", expected);
    }
}

ResultArena::ResultArena(uint32_t slots_num, SlotLayout layout)
: layout_{layout}
, slot_size_{layout.slot_size()} {
    slots_.reserve(slots_num);
    for (uint32_t i = 0; i < slots_num; ++i) {
        auto name = concat_tostr("sandpool-slot-", i);
        FileDescriptor memfd{memfd_create(name.c_str(), MFD_CLOEXEC | MFD_ALLOW_SEALING)};
        if (!memfd.is_open()) {
            THROW("memfd_create()", errmsg());
        }
        if (ftruncate(memfd, static_cast<off_t>(slot_size_))) {
            THROW("ftruncate()", errmsg());
        }
        if (fcntl(memfd, F_ADD_SEALS, F_SEAL_SHRINK | F_SEAL_GROW | F_SEAL_SEAL)) {
            THROW("fcntl(F_ADD_SEALS)", errmsg());
        }
        MappedSlot mapping{memfd, true};
        auto& hdr = *new (mapping.data()) SlotHeader{};
        hdr.state.store(static_cast<uint32_t>(SlotState::FREE), std::memory_order_relaxed);
        hdr.request_capacity = layout_.request_capacity;
        hdr.output_capacity = layout_.output_capacity;
        slots_.push_back({.memfd = std::move(memfd), .mapping = std::move(mapping)});
    }
}

void ResultArena::check_index(uint32_t slot) const {
    if (slot >= slots_.size()) {
        THROW("invalid slot index: ", slot);
    }
}

bool ResultArena::transition(uint32_t slot, SlotState from, SlotState to) noexcept {
    auto expected = static_cast<uint32_t>(from);
    return header(slot).state.compare_exchange_strong(
        expected, static_cast<uint32_t>(to), std::memory_order_acq_rel
    );
}

std::optional<uint32_t> ResultArena::reserve(CorrelationId correlation_id) {
    auto n = static_cast<uint32_t>(slots_.size());
    auto start = next_hint_.load(std::memory_order_relaxed);
    for (uint32_t k = 0; k < n; ++k) {
        uint32_t slot = (start + k) % n;
        if (!transition(slot, SlotState::FREE, SlotState::RESERVED)) {
            continue;
        }
        next_hint_.store((slot + 1) % n, std::memory_order_relaxed);

        // Nothing of the previous job may survive
        if (fallocate(
                slots_[slot].memfd,
                FALLOC_FL_PUNCH_HOLE | FALLOC_FL_KEEP_SIZE,
                SlotLayout::header_size,
                static_cast<off_t>(slot_size_ - SlotLayout::header_size)
            ))
        {
            int errnum = errno;
            reclaim(slot);
            THROW("fallocate()", errmsg(errnum));
        }
        auto& hdr = header(slot);
        hdr.request_capacity = layout_.request_capacity;
        hdr.output_capacity = layout_.output_capacity;
        hdr.request_len = 0;
        hdr.correlation_id = correlation_id;
        hdr.stdout_len = 0;
        hdr.stderr_len = 0;
        hdr.flags = 0;
        std::atomic_thread_fence(std::memory_order_release);
        return slot;
    }
    return std::nullopt;
}

void ResultArena::write_request(uint32_t slot, std::string_view code) {
    check_index(slot);
    if (state(slot) != SlotState::RESERVED) {
        THROW("slot ", slot, " is not reserved");
    }
    if (code.size() > layout_.request_capacity) {
        THROW("request of ", code.size(), " bytes does not fit the request area of ", layout_.request_capacity, " bytes");
    }
    auto& hdr = header(slot);
    std::memcpy(
        slots_[slot].mapping.data() + SlotLayout::request_offset(),
        code.data(),
        code.size()
    );
    hdr.request_len = static_cast<uint32_t>(code.size());
}

bool ResultArena::is_written_by(uint32_t slot, CorrelationId correlation_id) const {
    check_index(slot);
    const auto& hdr = header(slot);
    return state(slot) == SlotState::WRITTEN && hdr.correlation_id == correlation_id &&
        hdr.stdout_len <= layout_.output_capacity && hdr.stderr_len <= layout_.output_capacity &&
        (hdr.flags & ~(STDOUT_TRUNCATED | STDERR_TRUNCATED)) == 0;
}

SlotOutputs ResultArena::outputs(uint32_t slot) const {
    check_index(slot);
    const auto& hdr = header(slot);
    auto flags = hdr.flags;
    return {
        .stdout_ref =
            {
                .offset = static_cast<uint32_t>(layout_.stdout_offset()),
                .length = std::min(hdr.stdout_len, layout_.output_capacity),
                .truncated = (flags & STDOUT_TRUNCATED) != 0,
            },
        .stderr_ref =
            {
                .offset = static_cast<uint32_t>(layout_.stderr_offset()),
                .length = std::min(hdr.stderr_len, layout_.output_capacity),
                .truncated = (flags & STDERR_TRUNCATED) != 0,
            },
    };
}

bool ResultArena::mark_consumed(uint32_t slot, CorrelationId correlation_id) {
    check_index(slot);
    return header(slot).correlation_id == correlation_id &&
        transition(slot, SlotState::WRITTEN, SlotState::CONSUMED);
}

bool ResultArena::release(uint32_t slot, CorrelationId correlation_id) {
    check_index(slot);
    if (header(slot).correlation_id != correlation_id) {
        return false;
    }
    return transition(slot, SlotState::CONSUMED, SlotState::FREE) ||
        transition(slot, SlotState::WRITTEN, SlotState::FREE);
}

void ResultArena::reclaim(uint32_t slot) noexcept {
    if (slot < slots_.size()) {
        header(slot).state.store(static_cast<uint32_t>(SlotState::FREE), std::memory_order_release);
    }
}

SlotState ResultArena::state(uint32_t slot) const {
    check_index(slot);
    return static_cast<SlotState>(header(slot).state.load(std::memory_order_acquire));
}

size_t ResultArena::free_slots_num() const noexcept {
    size_t res = 0;
    for (uint32_t i = 0; i < slots_.size(); ++i) {
        res += header(i).state.load(std::memory_order_relaxed) ==
            static_cast<uint32_t>(SlotState::FREE);
    }
    return res;
}

int ResultArena::fd(uint32_t slot) const {
    check_index(slot);
    return slots_[slot].memfd;
}

FileDescriptor ResultArena::sealed_copy_fd(uint32_t slot) const {
    check_index(slot);
    FileDescriptor fd{memfd_create("sandpool-result", MFD_CLOEXEC | MFD_ALLOW_SEALING)};
    if (!fd.is_open()) {
        THROW("memfd_create()", errmsg());
    }
    const auto& mapping = slots_[slot].mapping;
    write_exact(fd, mapping.data(), mapping.size());
    if (fcntl(fd, F_ADD_SEALS, F_SEAL_SHRINK | F_SEAL_GROW | F_SEAL_WRITE | F_SEAL_SEAL)) {
        THROW("fcntl(F_ADD_SEALS)", errmsg());
    }
    return fd;
}

std::string_view ResultArena::stdout_data(uint32_t slot) const {
    auto ref = outputs(slot).stdout_ref;
    return slots_[slot].mapping.view(ref.offset, ref.length);
}

std::string_view ResultArena::stderr_data(uint32_t slot) const {
    auto ref = outputs(slot).stderr_ref;
    return slots_[slot].mapping.view(ref.offset, ref.length);
}

} // namespace sandpool::arena
