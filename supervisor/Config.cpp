#include "Config.hpp"
#include "Logger.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

const char* toString(DetectionSource s) {
    switch (s) {
        case DetectionSource::Thermal: return "thermal";
        case DetectionSource::Color: return "color";
        case DetectionSource::Auto: return "auto";
    }
    return "auto";
}

const char* toString(ZoneMode m) {
    switch (m) {
        case ZoneMode::Person: return "person";
        case ZoneMode::Motion: return "motion";
        case ZoneMode::Both: return "both";
    }
    return "person";
}

static DetectionSource parseSource(const std::string& s) {
    if (s == "thermal") return DetectionSource::Thermal;
    if (s == "color") return DetectionSource::Color;
    if (s == "auto") return DetectionSource::Auto;
    throw ConfigError("unknown detection_source '" + s + "'");
}

static ZoneMode parseMode(const std::string& s) {
    if (s == "person") return ZoneMode::Person;
    if (s == "motion") return ZoneMode::Motion;
    if (s == "both") return ZoneMode::Both;
    throw ConfigError("unknown zone mode '" + s + "'");
}

static void require(bool cond, const std::string& msg) {
    if (!cond) throw ConfigError(msg);
}

// Each reader starts from the current values, so the same function both
// fills defaults and applies a partial per-camera override.
static void readStream(const json& j, StreamSettings& s) {
    s.transport = j.value("transport", s.transport);
    s.openTimeoutMs = j.value("open_timeout_ms", s.openTimeoutMs);
    s.readTimeoutMs = j.value("read_timeout_ms", s.readTimeoutMs);
    s.staleDebounceMs = j.value("stale_debounce_ms", s.staleDebounceMs);
    s.reconnectCooldownMs = j.value("reconnect_cooldown_ms", s.reconnectCooldownMs);
    s.backoffInitialMs = j.value("backoff_initial_ms", s.backoffInitialMs);
    s.backoffMaxMs = j.value("backoff_max_ms", s.backoffMaxMs);
    s.downAfterFailures = j.value("down_after_failures", s.downAfterFailures);
}

static void readMotion(const json& j, MotionSettings& m) {
    m.sensitivity = j.value("sensitivity", m.sensitivity);
    m.minArea = j.value("min_area", m.minArea);
    m.maxWidth = j.value("max_width", m.maxWidth);
    m.pixelThreshold = j.value("pixel_threshold", m.pixelThreshold);
    m.learningRate = j.value("learning_rate", m.learningRate);
    m.blurSize = j.value("blur_size", m.blurSize);
}

static void readDetection(const json& j, DetectionSettings& d) {
    d.modelPath = j.value("model_path", d.modelPath);
    d.inputSize = j.value("input_size", d.inputSize);
    d.inferenceFps = j.value("inference_fps", d.inferenceFps);
    d.personClassId = j.value("person_class_id", d.personClassId);
    d.confidenceThreshold = j.value("confidence_threshold", d.confidenceThreshold);
    d.thermalConfidenceThreshold = j.value("thermal_confidence_threshold", d.thermalConfidenceThreshold);
    d.nmsThreshold = j.value("nms_threshold", d.nmsThreshold);
    d.aspectRatioMin = j.value("aspect_ratio_min", d.aspectRatioMin);
    d.aspectRatioMax = j.value("aspect_ratio_max", d.aspectRatioMax);
    d.minBoxAreaRatio = j.value("min_box_area_ratio", d.minBoxAreaRatio);
    d.confirmFrames = j.value("confirm_frames", d.confirmFrames);
    d.maxGapFrames = j.value("max_gap_frames", d.maxGapFrames);
    d.sunriseHour = j.value("sunrise_hour", d.sunriseHour);
    d.sunsetHour = j.value("sunset_hour", d.sunsetHour);
}

static GlobalSettings readGlobal(const json& root) {
    GlobalSettings g;
    auto section = [&](const char* name) -> const json& {
        static const json empty = json::object();
        auto it = root.find(name);
        if (it == root.end()) return empty;
        if (!it->is_object()) throw ConfigError(std::string("section '") + name + "' must be an object");
        return *it;
    };

    readStream(section("stream"), g.stream);
    readMotion(section("motion"), g.motion);
    readDetection(section("detection"), g.detection);

    const json& th = section("thermal");
    g.thermal.claheEnabled = th.value("clahe_enabled", g.thermal.claheEnabled);
    g.thermal.claheClipLimit = th.value("clahe_clip_limit", g.thermal.claheClipLimit);
    g.thermal.claheTileSize = th.value("clahe_tile_size", g.thermal.claheTileSize);

    const json& ev = section("event");
    g.event.cooldownSeconds = ev.value("cooldown_seconds", g.event.cooldownSeconds);
    g.event.minEventDuration = ev.value("min_event_duration", g.event.minEventDuration);
    g.event.pendingExpirySeconds = ev.value("pending_expiry_seconds", g.event.pendingExpirySeconds);
    g.event.prebufferSeconds = ev.value("prebuffer_seconds", g.event.prebufferSeconds);
    g.event.postbufferSeconds = ev.value("postbuffer_seconds", g.event.postbufferSeconds);

    const json& es = section("events");
    g.event.streamPath = es.value("stream_path", g.event.streamPath);
    g.event.outboxPath = es.value("outbox_path", g.event.outboxPath);
    g.event.dbPath = es.value("db_path", g.event.dbPath);

    const json& rg = section("ring");
    g.ring.seconds = rg.value("seconds", g.ring.seconds);
    g.ring.outputFps = rg.value("output_fps", g.ring.outputFps);
    g.ring.maxWidth = rg.value("max_width", g.ring.maxWidth);
    g.ring.maxHeight = rg.value("max_height", g.ring.maxHeight);

    const json& rc = section("recorder");
    g.recorder.enabled = rc.value("enabled", g.recorder.enabled);
    g.recorder.encoderPath = rc.value("encoder_path", g.recorder.encoderPath);
    g.recorder.root = rc.value("root", g.recorder.root);
    g.recorder.segmentSeconds = rc.value("segment_seconds", g.recorder.segmentSeconds);
    g.recorder.retentionMinutes = rc.value("retention_minutes", g.recorder.retentionMinutes);
    g.recorder.pollIntervalMs = rc.value("poll_interval_ms", g.recorder.pollIntervalMs);
    g.recorder.restartDebounceMs = rc.value("restart_debounce_ms", g.recorder.restartDebounceMs);
    g.recorder.restartCooldownMs = rc.value("restart_cooldown_ms", g.recorder.restartCooldownMs);
    g.recorder.stopTimeoutMs = rc.value("stop_timeout_ms", g.recorder.stopTimeoutMs);
    g.recorder.diskLimitPercent = rc.value("disk_limit_percent", g.recorder.diskLimitPercent);
    g.recorder.maxTotalBytes = rc.value("max_total_bytes", g.recorder.maxTotalBytes);

    const json& md = section("media");
    g.media.encoderPath = md.value("encoder_path", g.media.encoderPath);
    g.media.root = md.value("root", g.media.root);
    g.media.collageWorkers = md.value("collage_workers", g.media.collageWorkers);
    g.media.clipWorkers = md.value("clip_workers", g.media.clipWorkers);
    g.media.queueLimit = md.value("queue_limit", g.media.queueLimit);
    g.media.minOutputBytes = md.value("min_output_bytes", g.media.minOutputBytes);
    g.media.encodeTimeoutSeconds = md.value("encode_timeout_seconds", g.media.encodeTimeoutSeconds);
    g.media.outputFps = md.value("output_fps", g.media.outputFps);
    g.media.outputWidth = md.value("output_width", g.media.outputWidth);
    g.media.outputHeight = md.value("output_height", g.media.outputHeight);
    g.media.collageFrames = md.value("collage_frames", g.media.collageFrames);
    g.media.jpegQuality = md.value("jpeg_quality", g.media.jpegQuality);
    g.media.previewEnabled = md.value("preview_enabled", g.media.previewEnabled);
    g.media.retentionDays = md.value("retention_days", g.media.retentionDays);

    const json& ap = section("approval");
    g.approval.enabled = ap.value("enabled", g.approval.enabled);
    g.approval.command = ap.value("command", g.approval.command);
    g.approval.timeoutSeconds = ap.value("timeout_seconds", g.approval.timeoutSeconds);

    const json& st = section("status");
    g.status.path = st.value("path", g.status.path);
    g.status.intervalMs = st.value("interval_ms", g.status.intervalMs);

    const json& lg = section("logging");
    g.logging.level = lg.value("level", g.logging.level);
    g.logging.path = lg.value("path", g.logging.path);
    return g;
}

static CameraSettings readCamera(const json& j, const GlobalSettings& g) {
    require(j.is_object(), "camera entry must be an object");
    CameraSettings c;
    c.id = j.value("id", std::string());
    c.name = j.value("name", c.id);
    c.restreamUrl = j.value("restream_url", std::string());
    c.source = parseSource(j.value("detection_source", std::string("auto")));
    c.enabled = j.value("enabled", true);
    c.motion = g.motion;
    c.detection = g.detection;
    if (j.contains("motion")) readMotion(j.at("motion"), c.motion);
    if (j.contains("detection")) readDetection(j.at("detection"), c.detection);

    if (j.contains("zones")) {
        for (const auto& zj : j.at("zones")) {
            Zone z;
            z.id = zj.value("id", std::string());
            z.name = zj.value("name", z.id);
            z.mode = parseMode(zj.value("mode", std::string("person")));
            z.enabled = zj.value("enabled", true);
            for (const auto& pj : zj.value("polygon", json::array())) {
                require(pj.is_array() && pj.size() == 2, "zone '" + z.id + "': point must be [x, y]");
                z.polygon.push_back({pj[0].get<float>(), pj[1].get<float>()});
            }
            c.zones.push_back(std::move(z));
        }
    }
    validateCamera(c);
    return c;
}

void validateZone(const Zone& z) {
    require(!z.id.empty(), "zone without id");
    require(z.polygon.size() >= 3, "zone '" + z.id + "': polygon needs at least 3 points");
    for (const auto& p : z.polygon) {
        require(p.x >= 0.f && p.x <= 1.f && p.y >= 0.f && p.y <= 1.f,
                "zone '" + z.id + "': coordinates must be normalized to [0,1]");
    }
}

static void validateMotion(const MotionSettings& m) {
    require(m.sensitivity >= 1 && m.sensitivity <= 10, "motion.sensitivity must be 1..10");
    require(m.minArea > 0, "motion.min_area must be positive");
    require(m.maxWidth >= 64, "motion.max_width too small");
    require(m.pixelThreshold > 0 && m.pixelThreshold < 255, "motion.pixel_threshold must be 1..254");
    require(m.learningRate > 0 && m.learningRate <= 1, "motion.learning_rate must be (0,1]");
    require(m.blurSize > 0 && m.blurSize % 2 == 1, "motion.blur_size must be odd");
}

static void validateDetection(const DetectionSettings& d) {
    require(d.inputSize >= 32 && d.inputSize % 32 == 0, "detection.input_size must be a multiple of 32");
    require(d.inferenceFps >= 1 && d.inferenceFps <= 30, "detection.inference_fps must be 1..30");
    require(d.confidenceThreshold > 0 && d.confidenceThreshold < 1, "detection.confidence_threshold must be (0,1)");
    require(d.thermalConfidenceThreshold > 0 && d.thermalConfidenceThreshold < 1,
            "detection.thermal_confidence_threshold must be (0,1)");
    require(d.nmsThreshold > 0 && d.nmsThreshold < 1, "detection.nms_threshold must be (0,1)");
    require(d.aspectRatioMin > 0 && d.aspectRatioMin < d.aspectRatioMax, "detection aspect ratio range invalid");
    require(d.minBoxAreaRatio >= 0 && d.minBoxAreaRatio < 1, "detection.min_box_area_ratio must be [0,1)");
    require(d.confirmFrames >= 1, "detection.confirm_frames must be >= 1");
    require(d.maxGapFrames >= 0, "detection.max_gap_frames must be >= 0");
    require(d.sunriseHour >= 0 && d.sunriseHour < d.sunsetHour && d.sunsetHour <= 24,
            "detection sunrise/sunset hours invalid");
}

void validateCamera(const CameraSettings& c) {
    require(!c.id.empty(), "camera without id");
    for (char ch : c.id) {
        require(isalnum((unsigned char)ch) || ch == '_' || ch == '-',
                "camera id '" + c.id + "' may only contain [A-Za-z0-9_-]");
    }
    require(!c.enabled || !c.restreamUrl.empty(), "camera '" + c.id + "': restream_url missing");
    validateMotion(c.motion);
    validateDetection(c.detection);
    for (const auto& z : c.zones) validateZone(z);
}

void validateGlobal(const GlobalSettings& g) {
    require(g.stream.openTimeoutMs > 0 && g.stream.readTimeoutMs > 0, "stream timeouts must be positive");
    require(g.stream.staleDebounceMs > 0, "stream.stale_debounce_ms must be positive");
    require(g.stream.backoffInitialMs > 0 && g.stream.backoffMaxMs >= g.stream.backoffInitialMs,
            "stream backoff range invalid");
    require(g.stream.downAfterFailures >= 1, "stream.down_after_failures must be >= 1");
    validateMotion(g.motion);
    validateDetection(g.detection);
    require(g.thermal.claheClipLimit > 0 && g.thermal.claheTileSize > 0, "thermal CLAHE settings invalid");
    require(g.event.cooldownSeconds >= 0, "event.cooldown_seconds must be >= 0");
    require(g.event.minEventDuration >= 0, "event.min_event_duration must be >= 0");
    require(g.event.prebufferSeconds >= 0 && g.event.postbufferSeconds >= 0, "event buffers must be >= 0");
    require(g.ring.seconds > 0 && g.ring.outputFps > 0, "ring size must be positive");
    require(g.ring.maxWidth > 0 && g.ring.maxHeight > 0, "ring frame size must be positive");
    require(g.recorder.segmentSeconds >= 5, "recorder.segment_seconds must be >= 5");
    require(g.recorder.retentionMinutes >= 1, "recorder.retention_minutes must be >= 1");
    require(g.recorder.diskLimitPercent >= 50 && g.recorder.diskLimitPercent <= 95,
            "recorder.disk_limit_percent must be 50..95");
    require(g.recorder.pollIntervalMs > 0 && g.recorder.stopTimeoutMs > 0, "recorder timings must be positive");
    require(g.media.collageWorkers >= 1 && g.media.clipWorkers >= 1, "media worker counts must be >= 1");
    require(g.media.queueLimit >= 1, "media.queue_limit must be >= 1");
    require(g.media.collageFrames >= 1 && g.media.collageFrames <= 6, "media.collage_frames must be 1..6");
    require(g.media.outputFps >= 1, "media.output_fps must be >= 1");
    require(g.media.retentionDays >= 1, "media.retention_days must be >= 1");
    require(!g.approval.enabled || !g.approval.command.empty(), "approval enabled without command");
    require(g.approval.timeoutSeconds > 0, "approval.timeout_seconds must be positive");
}

const CameraSettings* ConfigSnapshot::camera(const std::string& id) const {
    for (const auto& c : cameras) {
        if (c.id == id) return &c;
    }
    return nullptr;
}

static json parseDocument(const std::string& text) {
    try {
        json root = json::parse(text);
        if (!root.is_object()) throw ConfigError("settings document must be a JSON object");
        return root;
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid JSON: ") + e.what());
    }
}

ConfigSnapshot parseConfig(const std::string& jsonText) {
    json root = parseDocument(jsonText);
    ConfigSnapshot snap;
    try {
        snap.global = readGlobal(root);
        validateGlobal(snap.global);
        for (const auto& cj : root.value("cameras", json::array())) {
            snap.cameras.push_back(readCamera(cj, snap.global));
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid value: ") + e.what());
    }
    for (size_t i = 0; i < snap.cameras.size(); i++) {
        for (size_t k = i + 1; k < snap.cameras.size(); k++) {
            require(snap.cameras[i].id != snap.cameras[k].id, "duplicate camera id '" + snap.cameras[i].id + "'");
        }
    }
    return snap;
}

ConfigStore::ConfigStore(std::string path) : filePath(std::move(path)) {}

static std::string readFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) throw ConfigError("cannot open settings file " + path);
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

ConfigPtr ConfigStore::load() {
    auto snap = std::make_shared<ConfigSnapshot>(parseConfig(readFile(filePath)));
    std::lock_guard<std::mutex> lock(mtx);
    snap->version = nextVersion++;
    snapshot = snap;
    return snapshot;
}

ConfigPtr ConfigStore::reload() {
    std::string text;
    try {
        text = readFile(filePath);
    } catch (const ConfigError& e) {
        logError("Config", std::string("reload rejected: ") + e.what());
        return current();
    }
    return apply(text);
}

ConfigPtr ConfigStore::apply(const std::string& jsonText) {
    ConfigPtr prev = current();
    auto next = std::make_shared<ConfigSnapshot>();

    json root;
    try {
        root = parseDocument(jsonText);
        next->global = readGlobal(root);
        validateGlobal(next->global);
        if (root.contains("cameras") && !root["cameras"].is_array()) throw ConfigError("cameras must be an array");
    } catch (const ConfigError& e) {
        logError("Config", std::string("reload rejected: ") + e.what());
        return prev;
    } catch (const json::exception& e) {
        logError("Config", std::string("reload rejected: ") + e.what());
        return prev;
    }

    json cams = root.value("cameras", json::array());
    for (const auto& cj : cams) {
        std::string id;
        if (cj.is_object() && cj.contains("id") && cj["id"].is_string()) id = cj["id"].get<std::string>();
        try {
            CameraSettings c = readCamera(cj, next->global);
            if (next->camera(c.id)) throw ConfigError("duplicate camera id '" + c.id + "'");
            next->cameras.push_back(std::move(c));
        } catch (const std::exception& e) {
            const CameraSettings* old = prev ? prev->camera(id) : nullptr;
            if (old && !next->camera(id)) {
                logError("Config", "camera '" + id + "' settings rejected, keeping previous: " + e.what());
                next->cameras.push_back(*old);
            } else {
                logError("Config", "camera '" + id + "' settings rejected: " + e.what());
            }
        }
    }

    std::lock_guard<std::mutex> lock(mtx);
    next->version = nextVersion++;
    snapshot = next;
    logInfo("Config", "settings version " + std::to_string(next->version) + " applied (" +
                          std::to_string(next->cameras.size()) + " cameras)");
    return snapshot;
}

ConfigPtr ConfigStore::current() const {
    std::lock_guard<std::mutex> lock(mtx);
    return snapshot;
}
