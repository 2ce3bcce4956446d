/**
 * FileCopyExecutor.cpp
 */

#include "FileCopyExecutor.hpp"
#include "../Logger.hpp"
#include "../../utils/HashUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <fstream>
#include <optional>
#include <vector>

namespace courier::core::downloader {

using transfer::TransferProgress;
namespace fs = std::filesystem;

namespace {

void discard(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

} // namespace

FileCopyExecutor::FileCopyExecutor(Options options)
    : m_options(options) {
    if (m_options.chunkSize == 0) {
        m_options.chunkSize = 64 * 1024;
    }
}

fs::path FileCopyExecutor::resolveSource(const std::string& url) {
    static const std::string kFileScheme = "file://";

    if (utils::StringUtils::startsWithIgnoreCase(url, kFileScheme)) {
        return fs::path(url.substr(kFileScheme.size()));
    }
    if (url.find("://") != std::string::npos) {
        return {};
    }
    return fs::path(url);
}

void FileCopyExecutor::operator()(const DownloadTask& task,
                                  const transfer::CancellationToken& token,
                                  const transfer::PauseLatch& pause,
                                  const ProgressEmitter& emit) const {
    fs::path source = resolveSource(task.url);
    if (source.empty()) {
        emit(TransferProgress::failed("Unsupported URL scheme: " + task.url));
        return;
    }
    if (task.destination.empty()) {
        emit(TransferProgress::failed("No destination for " + task.url));
        return;
    }

    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        emit(TransferProgress::failed("Source not found: " + source.string()));
        return;
    }

    auto total = static_cast<int64_t>(fs::file_size(source, ec));
    if (ec) {
        emit(TransferProgress::failed("Cannot stat " + source.string() + ": " + ec.message()));
        return;
    }

    fs::path destination(task.destination);
    if (destination.has_parent_path()) {
        fs::create_directories(destination.parent_path(), ec);
        if (ec) {
            emit(TransferProgress::failed("Cannot create " + destination.parent_path().string() +
                                          ": " + ec.message()));
            return;
        }
    }

    fs::path part = destination;
    part += ".part";

    std::ifstream in(source, std::ios::binary);
    if (!in.is_open()) {
        emit(TransferProgress::failed("Failed to open source file " + source.string()));
        return;
    }

    std::ofstream out(part, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        emit(TransferProgress::failed("Failed to open output file " + part.string()));
        return;
    }

    Logger::instance().debug("Copying {} -> {} ({})", source.string(), destination.string(),
                             utils::StringUtils::formatBytes(total));

    emit(TransferProgress::running(0, total));

    std::optional<utils::Sha1Hasher> hasher;
    if (task.hasChecksum()) {
        hasher.emplace();
    }

    std::vector<char> buffer(m_options.chunkSize);
    int64_t copied = 0;
    auto startTime = std::chrono::steady_clock::now();

    while (true) {
        if (pause.isPaused()) {
            emit(TransferProgress::paused(copied, total));
            if (pause.waitWhilePaused(token)) {
                emit(TransferProgress::running(copied, total));
            }
        }
        if (token.isCancelled()) {
            out.close();
            discard(part);
            emit(TransferProgress::cancelled(copied, total));
            return;
        }

        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = in.gcount();
        if (n <= 0) break;

        out.write(buffer.data(), n);
        if (!out) {
            out.close();
            discard(part);
            emit(TransferProgress::failed("Write failed for " + part.string(), copied, total));
            return;
        }
        if (hasher) {
            hasher->update(buffer.data(), static_cast<size_t>(n));
        }
        copied += n;

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime).count();
        double speed = elapsed > 0 ? copied * 1000.0 / static_cast<double>(elapsed) : 0.0;
        emit(TransferProgress::running(copied, std::max(total, copied), speed));

        if (m_options.chunkDelay.count() > 0) {
            token.waitFor(m_options.chunkDelay);
        }
    }

    if (in.bad()) {
        out.close();
        discard(part);
        emit(TransferProgress::failed("Read failed for " + source.string(), copied, total));
        return;
    }

    out.close();
    if (out.fail()) {
        discard(part);
        emit(TransferProgress::failed("Failed to finish " + part.string(), copied, total));
        return;
    }

    if (task.expectedSize >= 0 && copied != task.expectedSize) {
        discard(part);
        emit(TransferProgress::failed("Size mismatch: expected " + std::to_string(task.expectedSize) +
                                      " bytes, got " + std::to_string(copied), copied, total));
        return;
    }

    if (hasher && !utils::HashUtils::digestsEqual(hasher->hexDigest(), task.sha1)) {
        discard(part);
        emit(TransferProgress::failed("Checksum mismatch", copied, total));
        return;
    }

    fs::rename(part, destination, ec);
    if (ec) {
        discard(part);
        emit(TransferProgress::failed("Cannot move into place: " + ec.message(), copied, total));
        return;
    }

    emit(TransferProgress::completed(copied));
}

} // namespace courier::core::downloader
