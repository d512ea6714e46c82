/*
 * wasmtime_engine.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "wasmtime_engine.hpp"

#include "host_memory.hpp"
#include "logging/log_config.hpp"

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace pyvault::wasmtime {

namespace fs = std::filesystem;

using runtime::FailureStage;
using runtime::RunFailure;
using runtime::TrapKind;

namespace {

struct StoreDeleter {
    void operator()(wasmtime_store_t* store) const noexcept {
        wasmtime_store_delete(store);
    }
};
struct LinkerDeleter {
    void operator()(wasmtime_linker_t* linker) const noexcept {
        wasmtime_linker_delete(linker);
    }
};
struct ErrorDeleter {
    void operator()(wasmtime_error_t* error) const noexcept {
        wasmtime_error_delete(error);
    }
};
struct TrapDeleter {
    void operator()(wasm_trap_t* trap) const noexcept { wasm_trap_delete(trap); }
};
struct WasiConfigDeleter {
    void operator()(wasi_config_t* config) const noexcept {
        wasi_config_delete(config);
    }
};

using StorePtr = std::unique_ptr<wasmtime_store_t, StoreDeleter>;
using LinkerPtr = std::unique_ptr<wasmtime_linker_t, LinkerDeleter>;
using ErrorPtr = std::unique_ptr<wasmtime_error_t, ErrorDeleter>;
using TrapPtr = std::unique_ptr<wasm_trap_t, TrapDeleter>;
using WasiConfigPtr = std::unique_ptr<wasi_config_t, WasiConfigDeleter>;

std::string takeVec(wasm_byte_vec_t& vec) {
    std::string text(vec.data, vec.size);
    wasm_byte_vec_delete(&vec);
    while (!text.empty() && text.back() == '\0') {
        text.pop_back();
    }
    return text;
}

/**
 * @brief Temporary file receiving one guest output stream
 */
class CaptureFile {
public:
    static std::expected<CaptureFile, std::string> create(std::string_view stream) {
        std::error_code ec;
        auto directory = fs::temp_directory_path(ec);
        if (ec) {
            return std::unexpected(
                fmt::format("no temporary directory: {}", ec.message()));
        }

        auto pattern = (directory / fmt::format("pyvault_{}_XXXXXX", stream)).string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');

        const int fd = ::mkstemp(buffer.data());
        if (fd < 0) {
            return std::unexpected(fmt::format("cannot create capture file {}: {}",
                                               pattern, std::strerror(errno)));
        }
        ::close(fd);
        return CaptureFile(fs::path(buffer.data()));
    }

    CaptureFile(CaptureFile&& other) noexcept
        : path_(std::exchange(other.path_, fs::path{})) {}
    CaptureFile& operator=(CaptureFile&&) = delete;

    ~CaptureFile() {
        if (!path_.empty()) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    [[nodiscard]] const fs::path& path() const noexcept { return path_; }

    [[nodiscard]] std::optional<std::string> readAll() const {
        std::ifstream input(path_, std::ios::binary);
        if (!input.is_open()) {
            return std::nullopt;
        }
        return std::string{std::istreambuf_iterator<char>(input),
                           std::istreambuf_iterator<char>()};
    }

private:
    explicit CaptureFile(fs::path path) : path_(std::move(path)) {}

    fs::path path_;
};

/**
 * @brief Per-store state consulted by the epoch deadline callback
 */
struct EpochState {
    runtime::RunControl* control;
    bool interrupted{false};
};

wasmtime_error_t* onEpochDeadline(wasmtime_context_t* /*context*/, void* data,
                                  std::uint64_t* deadlineDelta,
                                  wasmtime_update_deadline_kind_t* updateKind) {
    auto* state = static_cast<EpochState*>(data);
    if (state->control->shouldInterrupt()) {
        state->interrupted = true;
        return wasmtime_error_new("epoch deadline reached: execution interrupted");
    }
    *deadlineDelta = 1;
    *updateKind = WASMTIME_UPDATE_DEADLINE_CONTINUE;
    return nullptr;
}

RunFailure failure(FailureStage stage, TrapKind trap, std::string message) {
    RunFailure result;
    result.stage = stage;
    result.trap = trap;
    result.messages.push_back(std::move(message));
    return result;
}

RunFailure describeError(FailureStage stage, const wasmtime_error_t* error,
                         const EpochState& epoch) {
    int status = 0;
    if (wasmtime_error_exit_status(error, &status)) {
        auto result = failure(stage, TrapKind::None,
                              fmt::format("exited with i32 exit status {}", status));
        result.exitStatus = status;
        return result;
    }
    return failure(stage, epoch.interrupted ? TrapKind::Interrupt : TrapKind::None,
                   errorMessage(error));
}

RunFailure describeTrap(FailureStage stage, const wasm_trap_t* trap,
                        const EpochState& epoch) {
    TrapKind kind = TrapKind::Unavailable;
    wasmtime_trap_code_t code = 0;
    if (epoch.interrupted) {
        kind = TrapKind::Interrupt;
    } else if (wasmtime_trap_code(trap, &code)) {
        switch (code) {
            case WASMTIME_TRAP_CODE_INTERRUPT:
                kind = TrapKind::Interrupt;
                break;
            case WASMTIME_TRAP_CODE_OUT_OF_FUEL:
                kind = TrapKind::OutOfFuel;
                break;
            default:
                kind = TrapKind::Other;
                break;
        }
    }
    return failure(stage, kind, trapMessage(trap));
}

}  // namespace

std::string errorMessage(const wasmtime_error_t* error) {
    wasm_name_t message;
    wasmtime_error_message(error, &message);
    return takeVec(message);
}

std::string trapMessage(const wasm_trap_t* trap) {
    wasm_message_t message;
    wasm_trap_message(trap, &message);
    return takeVec(message);
}

// ============================================================================
// WasmtimeModule
// ============================================================================

WasmtimeModule::~WasmtimeModule() { wasmtime_module_delete(module_); }

// ============================================================================
// WasmtimeEngine
// ============================================================================

std::expected<std::shared_ptr<WasmtimeEngine>, std::string> WasmtimeEngine::create(
    bool consumeFuel) {
    wasm_config_t* config = wasm_config_new();
    if (config == nullptr) {
        return std::unexpected("failed to allocate engine configuration");
    }
    wasmtime_config_epoch_interruption_set(config, true);
    wasmtime_config_consume_fuel_set(config, consumeFuel);
    wasmtime_config_memory_init_cow_set(config, false);

    auto creator = makeLimitedMemoryCreator();
    wasmtime_config_host_memory_creator_set(config, &creator);

    // Takes ownership of config
    wasm_engine_t* engine = wasm_engine_new_with_config(config);
    if (engine == nullptr) {
        return std::unexpected("failed to create engine");
    }

    auto logger = logging::LogConfig::getLogger();
    PYVAULT_LOG_DEBUG(logger, "Created Wasmtime engine (fuel: {})", consumeFuel);
    return std::shared_ptr<WasmtimeEngine>(new WasmtimeEngine(engine, consumeFuel));
}

WasmtimeEngine::~WasmtimeEngine() { wasm_engine_delete(engine_); }

void WasmtimeEngine::incrementEpoch() noexcept {
    wasmtime_engine_increment_epoch(engine_);
}

runtime::CompileResult WasmtimeEngine::compile(std::span<const std::uint8_t> bytes) {
    wasmtime_module_t* module = nullptr;
    ErrorPtr error(wasmtime_module_new(engine_, bytes.data(), bytes.size(), &module));
    if (error) {
        return std::unexpected(errorMessage(error.get()));
    }
    return std::make_shared<const WasmtimeModule>(module);
}

runtime::RunReport WasmtimeEngine::run(const runtime::Module& module,
                                       const runtime::GuestInvocation& invocation,
                                       runtime::GuestIo& io,
                                       runtime::ResourceLimiter& limiter,
                                       runtime::RunControl& control) {
    runtime::RunReport report;
    auto logger = logging::LogConfig::getLogger();

    const auto* wasmModule = dynamic_cast<const WasmtimeModule*>(&module);
    if (wasmModule == nullptr) {
        report.failure = failure(FailureStage::Setup, TrapKind::None,
                                 "module was not compiled by a Wasmtime engine");
        return report;
    }

    // Both must outlive the store
    ActiveLimiterScope limiterScope(limiter);
    EpochState epoch{&control};

    auto stdoutFile = CaptureFile::create("stdout");
    auto stderrFile = CaptureFile::create("stderr");
    if (!stdoutFile || !stderrFile) {
        report.failure = failure(FailureStage::Setup, TrapKind::None,
                                 !stdoutFile ? stdoutFile.error() : stderrFile.error());
        PYVAULT_LOG_ERROR(logger, "Output capture setup failed: {}",
                          report.failure->describe());
        return report;
    }

    StorePtr store(wasmtime_store_new(engine_, nullptr, nullptr));
    auto* context = wasmtime_store_context(store.get());

    const auto tableLimit = static_cast<std::int64_t>(
        std::min<std::uint64_t>(limiter.tableElementLimit(),
                                std::numeric_limits<std::int64_t>::max()));
    wasmtime_store_limiter(store.get(), -1, tableLimit, -1, -1, -1);

    wasmtime_context_set_epoch_deadline(context, 1);
    wasmtime_store_epoch_deadline_callback(store.get(), &onEpochDeadline, &epoch,
                                           nullptr);

    // An engine with fuel accounting traps at once on an empty tank
    if (fuel_ || invocation.fuel) {
        ErrorPtr error(wasmtime_context_set_fuel(
            context, invocation.fuel.value_or(std::numeric_limits<std::uint64_t>::max())));
        if (error) {
            report.failure = describeError(FailureStage::FuelSetup, error.get(), epoch);
            return report;
        }
    }

    // WASI context
    WasiConfigPtr wasi(wasi_config_new());

    std::vector<const char*> argv;
    argv.reserve(invocation.argv.size());
    for (const auto& arg : invocation.argv) {
        argv.push_back(arg.c_str());
    }
    if (!wasi_config_set_argv(wasi.get(), argv.size(), argv.data())) {
        report.failure = failure(FailureStage::Setup, TrapKind::None,
                                 "failed to set guest arguments");
        return report;
    }

    std::vector<const char*> names;
    std::vector<const char*> values;
    for (const auto& [name, value] : invocation.env) {
        names.push_back(name.c_str());
        values.push_back(value.c_str());
    }
    if (!wasi_config_set_env(wasi.get(), names.size(), names.data(), values.data())) {
        report.failure = failure(FailureStage::Setup, TrapKind::None,
                                 "failed to set guest environment");
        return report;
    }

    if (io.hasStdin) {
        const auto data = io.stdinStream.readRemaining();
        wasm_byte_vec_t bytes;
        wasm_byte_vec_new(&bytes, data.size(),
                          reinterpret_cast<const wasm_byte_t*>(data.data()));
        wasi_config_set_stdin_bytes(wasi.get(), &bytes);
    }

    if (!wasi_config_set_stdout_file(wasi.get(), stdoutFile->path().c_str()) ||
        !wasi_config_set_stderr_file(wasi.get(), stderrFile->path().c_str())) {
        report.failure = failure(FailureStage::Setup, TrapKind::None,
                                 "failed to attach output capture files");
        return report;
    }

    if (ErrorPtr error(wasmtime_context_set_wasi(context, wasi.release())); error) {
        report.failure = describeError(FailureStage::Setup, error.get(), epoch);
        return report;
    }

    LinkerPtr linker(wasmtime_linker_new(engine_));
    if (ErrorPtr error(wasmtime_linker_define_wasi(linker.get())); error) {
        report.failure = describeError(FailureStage::Setup, error.get(), epoch);
        report.failure->messages.insert(report.failure->messages.begin(),
                                        "failed to link WASI");
        return report;
    }

    // Instantiate
    wasmtime_instance_t instance;
    wasm_trap_t* rawTrap = nullptr;
    ErrorPtr error(wasmtime_linker_instantiate(linker.get(), context,
                                               wasmModule->get(), &instance,
                                               &rawTrap));
    TrapPtr trap(rawTrap);
    if (error) {
        report.failure = describeError(FailureStage::Instantiate, error.get(), epoch);
        return report;
    }
    if (trap) {
        report.failure = describeTrap(FailureStage::Instantiate, trap.get(), epoch);
        return report;
    }

    wasmtime_extern_t start;
    constexpr std::string_view kEntryPoint = "_start";
    if (!wasmtime_instance_export_get(context, &instance, kEntryPoint.data(),
                                      kEntryPoint.size(), &start) ||
        start.kind != WASMTIME_EXTERN_FUNC) {
        report.failure = failure(FailureStage::EntryPoint, TrapKind::None,
                                 "module has no exported _start function");
        return report;
    }

    // Run
    rawTrap = nullptr;
    error.reset(wasmtime_func_call(context, &start.of.func, nullptr, 0, nullptr, 0,
                                   &rawTrap));
    trap.reset(rawTrap);

    if (error) {
        report.failure = describeError(FailureStage::Call, error.get(), epoch);
    } else if (trap) {
        report.failure = describeTrap(FailureStage::Call, trap.get(), epoch);
    }

    if (fuel_) {
        std::uint64_t remaining = 0;
        if (ErrorPtr fuelError(wasmtime_context_get_fuel(context, &remaining));
            fuelError) {
            PYVAULT_LOG_WARN(logger, "Cannot read remaining fuel: {}",
                             errorMessage(fuelError.get()));
        } else {
            report.fuelRemaining = remaining;
        }
    }

    // Closes the guest's handles on the capture files
    linker.reset();
    store.reset();

    auto stdoutBytes = stdoutFile->readAll();
    auto stderrBytes = stderrFile->readAll();
    if (!stdoutBytes || !stderrBytes) {
        PYVAULT_LOG_WARN(logger, "Captured output could not be read back");
    }
    io.stdoutStream.write(stdoutBytes.value_or(std::string{}));
    io.stderrStream.write(stderrBytes.value_or(std::string{}));
    return report;
}

}  // namespace pyvault::wasmtime
