#include "RingBuffer.hpp"
#include "supervisor/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <pthread.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <opencv2/imgproc.hpp>

static constexpr uint32_t RING_MAGIC = 0x54445652;   // "TDVR"
static constexpr uint32_t RING_LAYOUT = 1;

struct RingHeader {
    uint32_t magic;
    uint32_t layout;
    uint32_t capacity;
    uint32_t maxWidth;
    uint32_t maxHeight;
    uint32_t reserved;
    uint64_t slotStride;
    uint64_t nextSeq;
    int64_t lastTs;
    pthread_mutex_t lock;
};

struct SlotHeader {
    uint64_t seq;
    int64_t timestampMs;
    int32_t width;
    int32_t height;
    uint64_t bytes;
};

static size_t align64(size_t n) { return (n + 63) & ~size_t(63); }
static size_t headerBytes() { return align64(sizeof(RingHeader)); }

namespace {
// Robust lock: a writer that died while holding the mutex leaves at worst
// one stale slot, which is overwritten on the next pass.
class RingLock {
    pthread_mutex_t* m;
public:
    explicit RingLock(pthread_mutex_t* mutex) : m(mutex) {
        int r = pthread_mutex_lock(m);
        if (r == EOWNERDEAD) pthread_mutex_consistent(m);
    }
    ~RingLock() { pthread_mutex_unlock(m); }
};
}

std::string SharedFrameRing::shmName(const std::string& cameraId) {
    std::string n = "/tdv_ring_";
    for (char c : cameraId) n += (isalnum((unsigned char)c) || c == '-' || c == '_') ? c : '_';
    return n;
}

std::unique_ptr<SharedFrameRing> SharedFrameRing::create(const std::string& cameraId, uint32_t capacity,
                                                         uint32_t maxWidth, uint32_t maxHeight) {
    if (capacity == 0 || maxWidth == 0 || maxHeight == 0) return nullptr;

    std::unique_ptr<SharedFrameRing> ring(new SharedFrameRing());
    ring->camId = cameraId;
    ring->name = shmName(cameraId);
    ring->owner = true;

    shm_unlink(ring->name.c_str());
    int fd = shm_open(ring->name.c_str(), O_CREAT | O_EXCL | O_RDWR, 0600);
    if (fd < 0) {
        logError("Ring", "shm_open " + ring->name + ": " + strerror(errno));
        return nullptr;
    }

    uint64_t stride = align64(sizeof(SlotHeader) + (size_t)maxWidth * maxHeight * 3);
    size_t total = headerBytes() + stride * capacity;
    if (ftruncate(fd, (off_t)total) != 0) {
        logError("Ring", "ftruncate " + ring->name + ": " + strerror(errno));
        close(fd);
        shm_unlink(ring->name.c_str());
        return nullptr;
    }
    void* mem = mmap(nullptr, total, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    close(fd);
    if (mem == MAP_FAILED) {
        logError("Ring", "mmap " + ring->name + ": " + strerror(errno));
        shm_unlink(ring->name.c_str());
        return nullptr;
    }

    ring->base = mem;
    ring->mappedBytes = total;
    ring->header = static_cast<RingHeader*>(mem);

    RingHeader* h = ring->header;
    h->layout = RING_LAYOUT;
    h->capacity = capacity;
    h->maxWidth = maxWidth;
    h->maxHeight = maxHeight;
    h->slotStride = stride;
    h->nextSeq = 0;
    h->lastTs = 0;

    pthread_mutexattr_t attr;
    pthread_mutexattr_init(&attr);
    pthread_mutexattr_setpshared(&attr, PTHREAD_PROCESS_SHARED);
    pthread_mutexattr_setrobust(&attr, PTHREAD_MUTEX_ROBUST);
    pthread_mutex_init(&h->lock, &attr);
    pthread_mutexattr_destroy(&attr);

    __atomic_store_n(&h->magic, RING_MAGIC, __ATOMIC_RELEASE);

    logInfo("Ring", cameraId + ": " + std::to_string(capacity) + " slots of " +
                        std::to_string(maxWidth) + "x" + std::to_string(maxHeight) + " (" +
                        std::to_string(total / (1024 * 1024)) + " MB)");
    return ring;
}

std::unique_ptr<SharedFrameRing> SharedFrameRing::attach(const std::string& cameraId) {
    std::string name = shmName(cameraId);
    int fd = shm_open(name.c_str(), O_RDWR, 0600);
    if (fd < 0) return nullptr;

    struct stat st;
    if (fstat(fd, &st) != 0 || (size_t)st.st_size < headerBytes()) {
        close(fd);
        return nullptr;
    }
    void* mem = mmap(nullptr, (size_t)st.st_size, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    close(fd);
    if (mem == MAP_FAILED) return nullptr;

    RingHeader* h = static_cast<RingHeader*>(mem);
    if (__atomic_load_n(&h->magic, __ATOMIC_ACQUIRE) != RING_MAGIC || h->layout != RING_LAYOUT ||
        headerBytes() + h->slotStride * h->capacity > (size_t)st.st_size) {
        munmap(mem, (size_t)st.st_size);
        return nullptr;
    }

    std::unique_ptr<SharedFrameRing> ring(new SharedFrameRing());
    ring->camId = cameraId;
    ring->name = name;
    ring->base = mem;
    ring->mappedBytes = (size_t)st.st_size;
    ring->header = h;
    return ring;
}

SharedFrameRing::~SharedFrameRing() {
    if (base) munmap(base, mappedBytes);
    if (owner) shm_unlink(name.c_str());
}

uint8_t* SharedFrameRing::slotAt(uint64_t seq) const {
    return static_cast<uint8_t*>(base) + headerBytes() + (seq % header->capacity) * header->slotStride;
}

uint32_t SharedFrameRing::capacity() const { return header->capacity; }

uint64_t SharedFrameRing::written() {
    RingLock lock(&header->lock);
    return header->nextSeq;
}

int64_t SharedFrameRing::write(const cv::Mat& frame, int64_t timestampMs) {
    if (frame.empty() || frame.depth() != CV_8U) return -1;

    cv::Mat bgr;
    if (frame.channels() == 1) cv::cvtColor(frame, bgr, cv::COLOR_GRAY2BGR);
    else if (frame.channels() == 4) cv::cvtColor(frame, bgr, cv::COLOR_BGRA2BGR);
    else bgr = frame;

    if ((uint32_t)bgr.cols > header->maxWidth || (uint32_t)bgr.rows > header->maxHeight) {
        double scale = std::min((double)header->maxWidth / bgr.cols, (double)header->maxHeight / bgr.rows);
        cv::Mat scaled;
        cv::resize(bgr, scaled,
                   cv::Size(std::max(1, (int)(bgr.cols * scale)), std::max(1, (int)(bgr.rows * scale))),
                   0, 0, cv::INTER_AREA);
        bgr = scaled;
    }

    const size_t rowBytes = (size_t)bgr.cols * 3;

    RingLock lock(&header->lock);
    uint64_t seq = header->nextSeq;
    int64_t ts = std::max(timestampMs, header->lastTs);
    uint8_t* slot = slotAt(seq);
    SlotHeader* sh = reinterpret_cast<SlotHeader*>(slot);
    uint8_t* dst = slot + sizeof(SlotHeader);
    for (int y = 0; y < bgr.rows; y++) {
        memcpy(dst + y * rowBytes, bgr.ptr(y), rowBytes);
    }
    sh->seq = seq;
    sh->timestampMs = ts;
    sh->width = bgr.cols;
    sh->height = bgr.rows;
    sh->bytes = rowBytes * bgr.rows;
    header->lastTs = ts;
    header->nextSeq = seq + 1;
    return (int64_t)seq;
}

void SharedFrameRing::copyOut(const uint8_t* slot, RingFrame& out) const {
    const SlotHeader* sh = reinterpret_cast<const SlotHeader*>(slot);
    out.seq = sh->seq;
    out.timestampMs = sh->timestampMs;
    cv::Mat view(sh->height, sh->width, CV_8UC3, const_cast<uint8_t*>(slot + sizeof(SlotHeader)));
    out.image = view.clone();
}

RingReadResult SharedFrameRing::readRange(int64_t startMs, int64_t endMs, size_t maxFrames) {
    RingReadResult result;
    RingLock lock(&header->lock);

    uint64_t next = header->nextSeq;
    if (next == 0) {
        result.truncated = true;
        return result;
    }
    uint64_t oldest = next > header->capacity ? next - header->capacity : 0;
    const SlotHeader* first = reinterpret_cast<const SlotHeader*>(slotAt(oldest));
    result.truncated = startMs < first->timestampMs;

    uint64_t from = next;
    uint64_t to = oldest;
    for (uint64_t s = oldest; s < next; s++) {
        int64_t ts = reinterpret_cast<const SlotHeader*>(slotAt(s))->timestampMs;
        if (ts < startMs) continue;
        if (ts > endMs) break;
        if (from == next) from = s;
        to = s + 1;
    }
    if (from >= to) return result;

    const uint64_t count = to - from;
    std::vector<uint64_t> picks;
    if (maxFrames == 0 || count <= maxFrames) {
        for (uint64_t s = from; s < to; s++) picks.push_back(s);
    } else if (maxFrames == 1) {
        picks.push_back(from + count / 2);
    } else {
        for (size_t i = 0; i < maxFrames; i++) picks.push_back(from + i * (count - 1) / (maxFrames - 1));
    }
    for (uint64_t s : picks) {
        RingFrame f;
        copyOut(slotAt(s), f);
        result.frames.push_back(std::move(f));
    }
    return result;
}

bool SharedFrameRing::latest(RingFrame& out) {
    RingLock lock(&header->lock);
    if (header->nextSeq == 0) return false;
    copyOut(slotAt(header->nextSeq - 1), out);
    return true;
}

std::shared_ptr<SharedFrameRing> FrameRingRegistry::create(const std::string& cameraId, uint32_t capacity,
                                                           uint32_t maxWidth, uint32_t maxHeight) {
    std::shared_ptr<SharedFrameRing> ring = SharedFrameRing::create(cameraId, capacity, maxWidth, maxHeight);
    if (!ring) return nullptr;
    std::lock_guard<std::mutex> lock(mtx);
    rings[cameraId] = ring;
    return ring;
}

std::shared_ptr<SharedFrameRing> FrameRingRegistry::get(const std::string& cameraId) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = rings.find(cameraId);
    return it == rings.end() ? nullptr : it->second;
}

void FrameRingRegistry::release(const std::string& cameraId) {
    std::shared_ptr<SharedFrameRing> ring;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = rings.find(cameraId);
        if (it == rings.end()) return;
        ring = std::move(it->second);
        rings.erase(it);
    }
    // Unmapped here, or by the last in-flight reader.
}

int64_t FrameRingRegistry::write(const std::string& cameraId, const cv::Mat& frame, int64_t timestampMs) {
    auto ring = get(cameraId);
    return ring ? ring->write(frame, timestampMs) : -1;
}

RingReadResult FrameRingRegistry::readRange(const std::string& cameraId, int64_t startMs, int64_t endMs,
                                            size_t maxFrames) {
    auto ring = get(cameraId);
    if (!ring) {
        RingReadResult r;
        r.truncated = true;
        return r;
    }
    return ring->readRange(startMs, endMs, maxFrames);
}
