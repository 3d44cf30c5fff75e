#pragma once

namespace sx {

// Per-connection pragmas, no write lock required, safe on every open.
// busy_timeout is set high (30 s) so readers and a second process wait out
// a long batch transaction held by the indexer.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA wal_autocheckpoint = 10000;
PRAGMA cache_size = -65536;
PRAGMA journal_size_limit = 33554432;
)";

// Database-level pragmas, require the write lock, run once when creating the DB.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x53585854;
PRAGMA user_version = 1;
)";

constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS settings (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS corpora (
    corpus_id TEXT PRIMARY KEY,
    model_id TEXT NOT NULL,
    dimensions INTEGER NOT NULL,
    created_at INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS entries (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    corpus_id TEXT NOT NULL REFERENCES corpora(corpus_id) ON DELETE CASCADE,
    file_path TEXT NOT NULL,
    source_type TEXT NOT NULL,
    heading TEXT NOT NULL DEFAULT '',
    text TEXT NOT NULL,
    embedding BLOB NOT NULL,
    content_hash TEXT NOT NULL,
    chunk_hash TEXT NOT NULL,
    chunk_ordinal INTEGER NOT NULL,
    char_start INTEGER NOT NULL,
    char_end INTEGER NOT NULL,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_entries_corpus_file ON entries(corpus_id, file_path);
CREATE INDEX IF NOT EXISTS idx_entries_corpus_type ON entries(corpus_id, source_type);

CREATE TABLE IF NOT EXISTS entry_dates (
    entry_id INTEGER NOT NULL REFERENCES entries(id) ON DELETE CASCADE,
    day TEXT NOT NULL,
    PRIMARY KEY (entry_id, day)
);

CREATE INDEX IF NOT EXISTS idx_entry_dates_day ON entry_dates(day);

CREATE TABLE IF NOT EXISTS file_state (
    corpus_id TEXT NOT NULL REFERENCES corpora(corpus_id) ON DELETE CASCADE,
    file_path TEXT NOT NULL,
    content_hash TEXT NOT NULL,
    source_type TEXT NOT NULL,
    indexed_bytes INTEGER NOT NULL DEFAULT 0,
    indexed_at INTEGER NOT NULL,
    PRIMARY KEY (corpus_id, file_path)
);
)";

constexpr const char* kDefaultSettings = R"(
INSERT OR IGNORE INTO settings (key, value) VALUES ('schema_version', '1');
)";

constexpr int kCurrentSchemaVersion = 1;

} // namespace sx
