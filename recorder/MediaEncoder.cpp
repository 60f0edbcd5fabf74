#include "MediaEncoder.hpp"
#include "supervisor/AtomicFile.hpp"
#include "supervisor/Logger.hpp"
#include "supervisor/Process.hpp"
#include <filesystem>
#include <system_error>
#include <unistd.h>

static std::vector<std::string> expandArgs(const std::string& binary, const std::vector<std::string>& args,
                                           const std::string& tmp) {
    std::vector<std::string> out = {binary};
    for (const auto& a : args) {
        std::string s = a;
        size_t pos;
        while ((pos = s.find("{out}")) != std::string::npos) s.replace(pos, 5, tmp);
        out.push_back(std::move(s));
    }
    return out;
}

EncodeResult MediaEncoder::finish(Process& p, const std::string& tmp, const std::string& finalPath) {
    EncodeResult r;
    if (!p.waitExit(timeout)) {
        p.stop(std::chrono::milliseconds(2000));
        unlink(tmp.c_str());
        r.error = "encoder timed out";
        return r;
    }
    r.exitCode = p.exitCode();
    if (r.exitCode != 0) {
        unlink(tmp.c_str());
        r.error = "encoder exit code " + std::to_string(r.exitCode);
        return r;
    }
    std::error_code ec;
    auto size = std::filesystem::file_size(tmp, ec);
    r.bytes = ec ? 0 : size;
    r.ok = promoteFile(tmp, finalPath, minBytes, r.error);
    return r;
}

EncodeResult MediaEncoder::run(const std::vector<std::string>& args, const std::string& finalPath) {
    std::string tmp = tempPathFor(finalPath);
    Process p;
    p.name = "encoder";
    p.argv = expandArgs(binary, args, tmp);
    if (!p.start()) {
        EncodeResult r;
        r.error = "cannot start " + binary;
        return r;
    }
    logDebug("Encoder", "[Exec] " + p.commandLine());
    return finish(p, tmp, finalPath);
}

EncodeResult MediaEncoder::runWithFrames(const std::vector<std::string>& args, const std::vector<cv::Mat>& frames,
                                         const std::string& finalPath) {
    std::string tmp = tempPathFor(finalPath);
    Process p;
    p.name = "encoder";
    p.argv = expandArgs(binary, args, tmp);
    p.pipeStdin = true;
    if (!p.start()) {
        EncodeResult r;
        r.error = "cannot start " + binary;
        return r;
    }
    logDebug("Encoder", "[Exec] " + p.commandLine() + " (" + std::to_string(frames.size()) + " frames)");

    for (const auto& f : frames) {
        cv::Mat c = f.isContinuous() ? f : f.clone();
        if (!p.writeStdin(c.data, c.total() * c.elemSize())) {
            logWarn("Encoder", "encoder closed its input early");
            break;
        }
    }
    p.closeStdin();
    return finish(p, tmp, finalPath);
}
