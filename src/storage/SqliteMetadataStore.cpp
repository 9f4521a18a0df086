#include "storage/SqliteMetadataStore.hpp"

#include <drogon/orm/Exception.h>
#include <drogon/orm/Result.h>
#include <trantor/utils/Logger.h>

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace infstore::storage {
namespace {

using drogon::orm::DrogonDbException;

Error dbError(ErrorKind kind, const std::string &operation, const DrogonDbException &ex) {
    return makeError(kind, operation + " failed: " + ex.base().what());
}

FileRecord toFileRecord(const drogon::orm::Row &row) {
    FileRecord record;
    record.id = row["id"].as<std::int64_t>();
    record.name = row["file_name"].as<std::string>();
    record.size = static_cast<std::uint64_t>(row["size"].as<std::int64_t>());
    record.chunkCount = static_cast<std::uint64_t>(row["total_chunks"].as<std::int64_t>());
    record.status = parseFileStatus(row["status"].as<std::string>()).value_or(FileStatus::Failed);
    record.ownerKey = row["owner_api_key"].as<std::string>();
    record.createdAt = row["created_at"].as<std::string>();
    record.updatedAt = row["updated_at"].as<std::string>();
    return record;
}

}  // namespace

SqliteMetadataStore::SqliteMetadataStore(drogon::orm::DbClientPtr client) : client_(std::move(client)) {
    if (!client_) {
        throw std::invalid_argument("SqliteMetadataStore requires a database client");
    }
    ensureSchema();
}

std::shared_ptr<SqliteMetadataStore> SqliteMetadataStore::open(const MetadataConfig &config) {
    std::filesystem::path path(config.databasePath);
    if (auto parent = path.parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            LOG_WARN << "Could not create database directory " << parent.string() << ": " << ec.message();
        }
    }
    auto client = drogon::orm::DbClient::newSqlite3Client("filename=" + path.string(), config.connections);
    LOG_INFO << "Opened metadata store at " << path.string();
    return std::make_shared<SqliteMetadataStore>(std::move(client));
}

void SqliteMetadataStore::ensureSchema() {
    client_->execSqlSync("PRAGMA journal_mode=WAL;");
    client_->execSqlSync("PRAGMA foreign_keys=ON;");
    client_->execSqlSync(
        "CREATE TABLE IF NOT EXISTS files ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  created_at DATETIME NOT NULL DEFAULT CURRENT_TIMESTAMP,"
        "  updated_at DATETIME NOT NULL DEFAULT CURRENT_TIMESTAMP,"
        "  file_name TEXT NOT NULL DEFAULT '',"
        "  size INTEGER NOT NULL DEFAULT 0,"
        "  total_chunks INTEGER NOT NULL DEFAULT 0,"
        "  status TEXT NOT NULL,"
        "  owner_api_key TEXT NOT NULL"
        ");");
    client_->execSqlSync("CREATE INDEX IF NOT EXISTS idx_files_owner_api_key ON files(owner_api_key);");
    client_->execSqlSync(
        "CREATE TABLE IF NOT EXISTS chunks ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  created_at DATETIME NOT NULL DEFAULT CURRENT_TIMESTAMP,"
        "  updated_at DATETIME NOT NULL DEFAULT CURRENT_TIMESTAMP,"
        "  file_id INTEGER NOT NULL REFERENCES files(id),"
        "  position INTEGER NOT NULL,"
        "  size INTEGER NOT NULL,"
        "  status TEXT NOT NULL,"
        "  external_ref TEXT NOT NULL DEFAULT '',"
        "  UNIQUE(file_id, position)"
        ");");
    client_->execSqlSync(
        "CREATE TABLE IF NOT EXISTS api_keys ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  created_at DATETIME NOT NULL DEFAULT CURRENT_TIMESTAMP,"
        "  api_key TEXT NOT NULL UNIQUE"
        ");");
}

Result<std::int64_t> SqliteMetadataStore::createFile(const std::string &ownerKey) {
    try {
        auto result = client_->execSqlSync(
            "INSERT INTO files(file_name, size, total_chunks, status, owner_api_key) VALUES('', 0, 0, ?, ?);",
            std::string(toString(FileStatus::Uploading)),
            ownerKey);
        return success(static_cast<std::int64_t>(result.insertId()));
    } catch (const DrogonDbException &ex) {
        return failure<std::int64_t>(dbError(ErrorKind::MetadataWriteFailure, "createFile", ex));
    }
}

Status SqliteMetadataStore::finalizeFile(std::int64_t fileId,
                                         const std::string &name,
                                         std::uint64_t size,
                                         std::uint64_t chunkCount) {
    try {
        auto result = client_->execSqlSync(
            "UPDATE files SET file_name = ?, size = ?, total_chunks = ?, status = ?, updated_at = CURRENT_TIMESTAMP "
            "WHERE id = ? AND status = ?;",
            name,
            static_cast<std::int64_t>(size),
            static_cast<std::int64_t>(chunkCount),
            std::string(toString(FileStatus::Completed)),
            fileId,
            std::string(toString(FileStatus::Uploading)));
        if (result.affectedRows() == 1) {
            return okStatus();
        }
    } catch (const DrogonDbException &ex) {
        return failedStatus(dbError(ErrorKind::MetadataWriteFailure, "finalizeFile", ex));
    }

    auto existing = getFile(fileId);
    if (!existing.ok()) {
        return failedStatus(*existing.error);
    }
    return failedStatus(makeError(ErrorKind::Conflict, "file " + std::to_string(fileId) + " is already finalized"));
}

Status SqliteMetadataStore::writeChunk(const ChunkRecord &chunk) {
    try {
        client_->execSqlSync(
            "INSERT INTO chunks(file_id, position, size, status, external_ref) VALUES(?, ?, ?, ?, ?) "
            "ON CONFLICT(file_id, position) DO UPDATE SET size = excluded.size, status = excluded.status, "
            "external_ref = excluded.external_ref, updated_at = CURRENT_TIMESTAMP;",
            chunk.fileId,
            static_cast<std::int64_t>(chunk.position),
            static_cast<std::int64_t>(chunk.size),
            std::string(toString(chunk.status)),
            chunk.externalRef);
        return okStatus();
    } catch (const DrogonDbException &ex) {
        return failedStatus(dbError(ErrorKind::MetadataWriteFailure, "writeChunk", ex));
    }
}

Result<bool> SqliteMetadataStore::lookupApiKey(const std::string &key) {
    try {
        auto result = client_->execSqlSync("SELECT id FROM api_keys WHERE api_key = ? LIMIT 1;", key);
        return success(!result.empty());
    } catch (const DrogonDbException &ex) {
        return failure<bool>(dbError(ErrorKind::Internal, "lookupApiKey", ex));
    }
}

Status SqliteMetadataStore::insertApiKey(const std::string &key) {
    // Uniqueness is decided by the insert itself so concurrent issuers cannot both pass a
    // separate existence check.
    try {
        auto result =
            client_->execSqlSync("INSERT INTO api_keys(api_key) VALUES(?) ON CONFLICT(api_key) DO NOTHING;", key);
        if (result.affectedRows() == 0) {
            return failedStatus(makeError(ErrorKind::Conflict, "API key already exists"));
        }
        return okStatus();
    } catch (const DrogonDbException &ex) {
        return failedStatus(dbError(ErrorKind::MetadataWriteFailure, "insertApiKey", ex));
    }
}

Result<FileRecord> SqliteMetadataStore::getFile(std::int64_t fileId) {
    try {
        auto result = client_->execSqlSync(
            "SELECT id, file_name, size, total_chunks, status, owner_api_key, created_at, updated_at "
            "FROM files WHERE id = ?;",
            fileId);
        if (result.empty()) {
            return failure<FileRecord>(
                makeError(ErrorKind::NotFound, "file " + std::to_string(fileId) + " does not exist"));
        }
        return success(toFileRecord(result[0]));
    } catch (const DrogonDbException &ex) {
        return failure<FileRecord>(dbError(ErrorKind::Internal, "getFile", ex));
    }
}

Result<std::vector<ChunkRecord>> SqliteMetadataStore::listChunks(std::int64_t fileId) {
    try {
        auto result = client_->execSqlSync(
            "SELECT file_id, position, size, status, external_ref FROM chunks WHERE file_id = ? ORDER BY position;",
            fileId);
        std::vector<ChunkRecord> chunks;
        chunks.reserve(result.size());
        for (const auto &row : result) {
            ChunkRecord chunk;
            chunk.fileId = row["file_id"].as<std::int64_t>();
            chunk.position = static_cast<std::uint32_t>(row["position"].as<std::int64_t>());
            chunk.size = static_cast<std::uint64_t>(row["size"].as<std::int64_t>());
            chunk.status = parseChunkStatus(row["status"].as<std::string>()).value_or(ChunkStatus::Failed);
            chunk.externalRef = row["external_ref"].as<std::string>();
            chunks.push_back(std::move(chunk));
        }
        return success(std::move(chunks));
    } catch (const DrogonDbException &ex) {
        return failure<std::vector<ChunkRecord>>(dbError(ErrorKind::Internal, "listChunks", ex));
    }
}

}  // namespace infstore::storage
