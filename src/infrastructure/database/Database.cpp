#include "infrastructure/database/Database.hpp"

#include <spdlog/spdlog.h>

namespace rackscan::infra {

// Statement implementation
Statement::Statement(sqlite3_stmt* stmt, std::recursive_mutex* mutex) : stmt_(stmt), mutex_(mutex) {}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_), mutex_(other.mutex_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        mutex_ = other.mutex_;
        other.stmt_ = nullptr;
    }
    return *this;
}

void Statement::bind(int index, int value) {
    int rc = sqlite3_bind_int(stmt_, index, value);
    if (rc != SQLITE_OK) {
        throw DatabaseError("Failed to bind int parameter", rc);
    }
}

void Statement::bind(int index, double value) {
    int rc = sqlite3_bind_double(stmt_, index, value);
    if (rc != SQLITE_OK) {
        throw DatabaseError("Failed to bind double parameter", rc);
    }
}

void Statement::bind(int index, const std::string& value) {
    int rc = sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        throw DatabaseError("Failed to bind text parameter", rc);
    }
}

void Statement::bindTextOrNull(int index, const std::string& value) {
    if (value.empty()) {
        bindNull(index);
    } else {
        bind(index, value);
    }
}

void Statement::bindNull(int index) {
    int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK) {
        throw DatabaseError("Failed to bind null parameter", rc);
    }
}

bool Statement::step() {
    std::lock_guard lock(*mutex_);
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    int extended = sqlite3_extended_errcode(sqlite3_db_handle(stmt_));
    throw DatabaseError(std::string("SQLite step failed: ") +
                            sqlite3_errmsg(sqlite3_db_handle(stmt_)),
                        extended);
}

int Statement::columnInt(int index) const {
    return sqlite3_column_int(stmt_, index);
}

std::string Statement::columnText(int index) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    return text ? text : "";
}

bool Statement::columnIsNull(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

// Database implementation
Database::Database(const std::string& path) {
    spdlog::info("Opening database: {}", path);

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw DatabaseError("Failed to open database: " + error, rc);
    }

    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, 5000);

    configureConnection();
    createMigrationsTable();
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void Database::configureConnection() {
    execute("PRAGMA journal_mode=WAL");
    execute("PRAGMA synchronous=NORMAL");
    execute("PRAGMA foreign_keys=ON");
}

void Database::execute(const std::string& sql) {
    std::lock_guard lock(mutex_);
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        throw DatabaseError("SQL execution failed: " + error, sqlite3_extended_errcode(db_));
    }
}

Statement Database::prepare(const std::string& sql) {
    std::lock_guard lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw DatabaseError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_), rc);
    }
    return Statement(stmt, &mutex_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

void Database::beginTransaction() {
    execute("BEGIN IMMEDIATE TRANSACTION");
}

void Database::commit() {
    execute("COMMIT");
}

void Database::rollback() {
    try {
        execute("ROLLBACK");
    } catch (const DatabaseError& e) {
        // SQLite may already have rolled back on its own (e.g. after SQLITE_FULL)
        spdlog::warn("Rollback failed: {}", e.what());
    }
}

void Database::createMigrationsTable() {
    execute(R"(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            applied_at TEXT DEFAULT CURRENT_TIMESTAMP
        )
    )");
}

int Database::getCurrentVersion() {
    auto stmt = prepare("SELECT MAX(version) FROM schema_migrations");
    if (stmt.step() && !stmt.columnIsNull(0)) {
        return stmt.columnInt(0);
    }
    return 0;
}

void Database::setVersion(int version) {
    auto stmt = prepare("INSERT INTO schema_migrations (version) VALUES (?)");
    stmt.bind(1, version);
    stmt.step();
}

void Database::runMigrations() {
    spdlog::info("Running database migrations...");

    int currentVersion = getCurrentVersion();
    spdlog::info("Current schema version: {}", currentVersion);

    // Migration 1: Inventory schema
    if (currentVersion < 1) {
        spdlog::info("Applying migration 1: Inventory schema");
        transaction([this] {
            execute(R"(
                CREATE TABLE IF NOT EXISTS datacenters (
                    id TEXT PRIMARY KEY,
                    name TEXT NOT NULL UNIQUE,
                    location TEXT,
                    description TEXT,
                    created_at TEXT NOT NULL,
                    updated_at TEXT NOT NULL
                )
            )");

            execute(R"(
                CREATE TABLE IF NOT EXISTS networks (
                    id TEXT PRIMARY KEY,
                    datacenter_id TEXT REFERENCES datacenters(id) ON DELETE SET NULL,
                    name TEXT NOT NULL,
                    subnet TEXT NOT NULL,
                    description TEXT,
                    vlan INTEGER DEFAULT 0,
                    created_at TEXT NOT NULL,
                    updated_at TEXT NOT NULL,
                    UNIQUE(datacenter_id, name)
                )
            )");

            execute("CREATE INDEX IF NOT EXISTS idx_networks_datacenter ON networks(datacenter_id)");

            execute(R"(
                CREATE TABLE IF NOT EXISTS devices (
                    id TEXT PRIMARY KEY,
                    datacenter_id TEXT REFERENCES datacenters(id) ON DELETE SET NULL,
                    name TEXT NOT NULL,
                    description TEXT,
                    make_model TEXT,
                    os TEXT,
                    username TEXT,
                    location TEXT,
                    created_at TEXT NOT NULL,
                    updated_at TEXT NOT NULL
                )
            )");

            execute("CREATE INDEX IF NOT EXISTS idx_devices_datacenter ON devices(datacenter_id)");

            execute(R"(
                CREATE TABLE IF NOT EXISTS addresses (
                    device_id TEXT NOT NULL REFERENCES devices(id) ON DELETE CASCADE,
                    ip TEXT NOT NULL,
                    port INTEGER,
                    type TEXT,
                    label TEXT,
                    network_id TEXT REFERENCES networks(id) ON DELETE SET NULL,
                    switch_port TEXT
                )
            )");

            execute("CREATE INDEX IF NOT EXISTS idx_addresses_device ON addresses(device_id)");
            execute("CREATE INDEX IF NOT EXISTS idx_addresses_ip ON addresses(ip)");

            execute(R"(
                CREATE TABLE IF NOT EXISTS tags (
                    device_id TEXT NOT NULL REFERENCES devices(id) ON DELETE CASCADE,
                    tag TEXT NOT NULL,
                    PRIMARY KEY (device_id, tag)
                )
            )");

            execute(R"(
                CREATE TABLE IF NOT EXISTS domains (
                    device_id TEXT NOT NULL REFERENCES devices(id) ON DELETE CASCADE,
                    domain TEXT NOT NULL,
                    PRIMARY KEY (device_id, domain)
                )
            )");

            setVersion(1);
        });
    }

    // Migration 2: Discovery schema
    if (currentVersion < 2) {
        spdlog::info("Applying migration 2: Discovery schema");
        transaction([this] {
            execute(R"(
                CREATE TABLE IF NOT EXISTS discovered_devices (
                    id TEXT PRIMARY KEY,
                    ip TEXT NOT NULL UNIQUE,
                    mac_address TEXT,
                    hostname TEXT,
                    network_id TEXT NOT NULL REFERENCES networks(id) ON DELETE CASCADE,
                    status TEXT NOT NULL DEFAULT 'unknown',
                    confidence INTEGER DEFAULT 0,
                    os_guess TEXT,
                    os_family TEXT,
                    open_ports TEXT,
                    services TEXT,
                    first_seen TEXT NOT NULL,
                    last_seen TEXT NOT NULL,
                    last_scan_id TEXT,
                    promoted_to_device_id TEXT REFERENCES devices(id) ON DELETE SET NULL,
                    promoted_at TEXT,
                    raw_scan_data TEXT,
                    created_at TEXT NOT NULL,
                    updated_at TEXT NOT NULL
                )
            )");

            execute("CREATE INDEX IF NOT EXISTS idx_discovered_devices_network ON discovered_devices(network_id)");
            execute("CREATE INDEX IF NOT EXISTS idx_discovered_devices_status ON discovered_devices(status)");
            execute("CREATE INDEX IF NOT EXISTS idx_discovered_devices_promoted ON discovered_devices(promoted_to_device_id)");
            execute("CREATE INDEX IF NOT EXISTS idx_discovered_devices_last_seen ON discovered_devices(last_seen)");

            execute(R"(
                CREATE TABLE IF NOT EXISTS discovery_scans (
                    id TEXT PRIMARY KEY,
                    network_id TEXT NOT NULL REFERENCES networks(id) ON DELETE CASCADE,
                    status TEXT NOT NULL DEFAULT 'pending',
                    scan_type TEXT NOT NULL,
                    scan_depth INTEGER DEFAULT 2,
                    total_hosts INTEGER DEFAULT 0,
                    scanned_hosts INTEGER DEFAULT 0,
                    found_hosts INTEGER DEFAULT 0,
                    progress_percent REAL DEFAULT 0,
                    started_at TEXT,
                    completed_at TEXT,
                    duration_seconds INTEGER DEFAULT 0,
                    error_message TEXT,
                    created_at TEXT NOT NULL,
                    updated_at TEXT NOT NULL
                )
            )");

            execute("CREATE INDEX IF NOT EXISTS idx_discovery_scans_network ON discovery_scans(network_id)");
            execute("CREATE INDEX IF NOT EXISTS idx_discovery_scans_created ON discovery_scans(created_at)");

            execute(R"(
                CREATE TABLE IF NOT EXISTS discovery_rules (
                    id TEXT PRIMARY KEY,
                    network_id TEXT NOT NULL UNIQUE REFERENCES networks(id) ON DELETE CASCADE,
                    enabled INTEGER DEFAULT 1,
                    scan_interval_hours INTEGER DEFAULT 24,
                    scan_type TEXT DEFAULT 'full',
                    max_concurrent_scans INTEGER DEFAULT 10,
                    timeout_seconds INTEGER DEFAULT 5,
                    scan_ports INTEGER DEFAULT 1,
                    port_scan_type TEXT DEFAULT 'common',
                    custom_ports TEXT,
                    service_detection INTEGER DEFAULT 1,
                    os_detection INTEGER DEFAULT 1,
                    exclude_ips TEXT,
                    exclude_hosts TEXT,
                    last_run_at TEXT,
                    next_run_at TEXT,
                    created_at TEXT NOT NULL,
                    updated_at TEXT NOT NULL
                )
            )");

            setVersion(2);
        });
    }

    spdlog::info("Database migrations complete. Version: {}", getCurrentVersion());
}

} // namespace rackscan::infra
