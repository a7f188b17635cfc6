/**
 * @file chunk_assembler.cpp
 * @brief Implementation of chunk assembly into files
 */

#include <kcenon/serial_transfer/core/chunk_assembler.h>

#include <kcenon/serial_transfer/core/chunk_config.h>
#include <kcenon/serial_transfer/core/logging.h>

namespace kcenon::serial_transfer {

namespace {

auto sanitize_filename(const std::string& announced) -> result<std::filesystem::path> {
    auto name = std::filesystem::path(announced).filename();
    if (name.empty() || name == "." || name == "..") {
        return unexpected(
            error{error_code::invalid_file_path, "unusable file name: '" + announced + "'"});
    }
    return name;
}

}  // namespace

chunk_assembler::chunk_assembler(std::filesystem::path output_dir)
    : output_dir_(std::move(output_dir)) {}

chunk_assembler::~chunk_assembler() {
    std::lock_guard lock(mutex_);
    abandon_locked();
}

auto chunk_assembler::begin_file(const file_metadata& meta) -> result<std::filesystem::path> {
    std::lock_guard lock(mutex_);

    if (active_) {
        ST_LOG_WARN(log_category::chunk,
                    "Abandoning '" + active_->meta.filename + "' for new file '" +
                        meta.filename + "'");
        abandon_locked();
    }

    auto name = sanitize_filename(meta.filename);
    if (!name) {
        return unexpected(name.error());
    }

    chunk_config layout(meta.chunk_size);
    if (auto valid = layout.validate(); !valid) {
        return unexpected(valid.error());
    }
    if (layout.calculate_chunk_count(meta.file_size) != meta.total_chunks) {
        return unexpected(error{
            error_code::invalid_payload,
            "chunk count " + std::to_string(meta.total_chunks) + " does not match size " +
                std::to_string(meta.file_size)});
    }

    std::error_code ec;
    std::filesystem::create_directories(output_dir_, ec);
    if (ec) {
        return unexpected(error{
            error_code::file_write_error,
            "cannot create output directory " + output_dir_.string() + ": " + ec.message()});
    }

    auto ctx = std::make_unique<assembly_context>();
    ctx->meta = meta;
    ctx->meta.filename = name.value().string();
    ctx->path = output_dir_ / name.value();

    ctx->file = std::make_unique<std::ofstream>(
        ctx->path, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!ctx->file->is_open()) {
        return unexpected(
            error{error_code::file_access_denied, "cannot create file: " + ctx->path.string()});
    }

    auto path = ctx->path;
    active_ = std::move(ctx);
    return path;
}

auto chunk_assembler::write_chunk(uint64_t index, std::span<const std::byte> data)
    -> result<chunk_write_status> {
    std::lock_guard lock(mutex_);

    if (!active_) {
        return unexpected(error{error_code::no_active_file, "no file is being received"});
    }

    auto& ctx = *active_;

    if (index < ctx.next_index) {
        return chunk_write_status::duplicate;
    }

    if (index != ctx.next_index || index >= ctx.meta.total_chunks) {
        return unexpected(error{
            error_code::chunk_sequence_error,
            "expected chunk " + std::to_string(ctx.next_index) + " of " +
                std::to_string(ctx.meta.total_chunks) + ", got " + std::to_string(index)});
    }

    chunk_config layout(ctx.meta.chunk_size);
    auto expected_length = layout.chunk_length(ctx.meta.file_size, index);
    if (data.size() != expected_length) {
        return unexpected(error{
            error_code::invalid_payload,
            "chunk " + std::to_string(index) + " has " + std::to_string(data.size()) +
                " bytes, expected " + std::to_string(expected_length)});
    }

    ctx.file->seekp(static_cast<std::streamoff>(index * ctx.meta.chunk_size));
    ctx.file->write(reinterpret_cast<const char*>(data.data()),
                    static_cast<std::streamsize>(data.size()));
    if (!ctx.file->good()) {
        return unexpected(
            error{error_code::file_write_error, "write failed: " + ctx.path.string()});
    }

    ctx.hasher.update(data);
    ++ctx.next_index;
    ctx.bytes_written += data.size();

    return chunk_write_status::written;
}

auto chunk_assembler::finalize(
    uint64_t total_chunks,
    uint64_t file_size,
    const sha256_digest& digest) -> result<std::filesystem::path> {
    std::lock_guard lock(mutex_);

    if (!active_) {
        return unexpected(error{error_code::no_active_file, "no file is being received"});
    }

    auto& ctx = *active_;

    if (total_chunks != ctx.meta.total_chunks || ctx.next_index != total_chunks ||
        file_size != ctx.bytes_written) {
        auto err = error{
            error_code::file_hash_mismatch,
            "'" + ctx.meta.filename + "' incomplete: " + std::to_string(ctx.next_index) + "/" +
                std::to_string(total_chunks) + " chunks, " + std::to_string(ctx.bytes_written) +
                "/" + std::to_string(file_size) + " bytes"};
        abandon_locked();
        return unexpected(err);
    }

    ctx.file->flush();
    ctx.file->close();
    if (ctx.file->fail()) {
        auto err = error{error_code::file_write_error, "close failed: " + ctx.path.string()};
        abandon_locked();
        return unexpected(err);
    }

    if (ctx.hasher.finalize() != digest) {
        auto err = error{
            error_code::file_hash_mismatch, "SHA-256 mismatch for '" + ctx.meta.filename + "'"};
        abandon_locked();
        return unexpected(err);
    }

    auto path = ctx.path;
    active_.reset();
    return path;
}

void chunk_assembler::abandon() {
    std::lock_guard lock(mutex_);
    abandon_locked();
}

void chunk_assembler::abandon_locked() {
    if (!active_) {
        return;
    }

    if (active_->file && active_->file->is_open()) {
        active_->file->close();
    }

    std::error_code ec;
    std::filesystem::remove(active_->path, ec);
    if (ec) {
        ST_LOG_WARN(log_category::chunk,
                    "Cannot remove partial file " + active_->path.string() + ": " + ec.message());
    }

    active_.reset();
}

auto chunk_assembler::has_active_file() const -> bool {
    std::lock_guard lock(mutex_);
    return active_ != nullptr;
}

auto chunk_assembler::active_metadata() const -> std::optional<file_metadata> {
    std::lock_guard lock(mutex_);
    if (!active_) {
        return std::nullopt;
    }
    return active_->meta;
}

auto chunk_assembler::get_progress() const -> std::optional<assembly_progress> {
    std::lock_guard lock(mutex_);
    if (!active_) {
        return std::nullopt;
    }

    assembly_progress progress;
    progress.total_chunks = active_->meta.total_chunks;
    progress.received_chunks = active_->next_index;
    progress.bytes_written = active_->bytes_written;
    return progress;
}

auto chunk_assembler::output_directory() const -> const std::filesystem::path& {
    return output_dir_;
}

}  // namespace kcenon::serial_transfer
