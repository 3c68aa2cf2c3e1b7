#include "loader/artifact_loader.hpp"

#include "log/log.hpp"

#include <bit>
#include <cstring>

#include <dlfcn.h>
#ifdef __ELF__
#include <elf.h>
#endif
#include <llvm-c/Core.h>
#include <llvm-c/Object.h>

namespace simforge::loader {

// ============================================================================
// LoadedArtifact
// ============================================================================

void* LoadedArtifact::symbol(const std::string& name) const {
    if (!handle_)
        return nullptr;
    return dlsym(handle_, name.c_str());
}

Result<std::vector<std::string>, std::string> LoadedArtifact::exported_symbols() const {
    return read_exported_symbols(path_);
}

// ============================================================================
// Symbol Table
// ============================================================================

namespace {

/// Named symbols with an address in `.symtab`. Empty when the table is
/// missing, which is the case for stripped libraries.
std::vector<std::string> read_static_symbols(LLVMBinaryRef binary) {
    std::vector<std::string> names;
    LLVMSymbolIteratorRef it = LLVMObjectFileCopySymbolIterator(binary);
    if (!it)
        return names;

    while (!LLVMObjectFileIsSymbolIteratorAtEnd(binary, it)) {
        const char* name = LLVMGetSymbolName(it);
        // Undefined (imported) symbols have no address in this object
        if (name && *name && LLVMGetSymbolAddress(it) != 0) {
            names.emplace_back(name);
        }
        LLVMMoveToNextSymbol(it);
    }
    LLVMDisposeSymbolIterator(it);
    return names;
}

#ifdef __ELF__
/// Raw contents of the section called `wanted`, or empty.
std::string_view section_contents(LLVMBinaryRef binary, std::string_view wanted) {
    LLVMSectionIteratorRef it = LLVMObjectFileCopySectionIterator(binary);
    if (!it)
        return {};

    std::string_view contents;
    while (!LLVMObjectFileIsSectionIteratorAtEnd(binary, it)) {
        const char* name = LLVMGetSectionName(it);
        if (name && wanted == name) {
            contents = std::string_view(LLVMGetSectionContents(it),
                                        static_cast<size_t>(LLVMGetSectionSize(it)));
            break;
        }
        LLVMMoveToNextSection(it);
    }
    LLVMDisposeSectionIterator(it);
    return contents;
}
#endif

/// Defined, visible entries of `.dynsym`. The C API only iterates `.symtab`,
/// so the ELF64 records are decoded from the raw section bytes.
std::vector<std::string> read_dynamic_symbols(LLVMBinaryRef binary) {
    std::vector<std::string> names;
#ifdef __ELF__
    // Native byte order only; the artifact is about to be loaded into this process
    LLVMBinaryType expected = std::endian::native == std::endian::little ? LLVMBinaryTypeELF64L
                                                                         : LLVMBinaryTypeELF64B;
    if (LLVMBinaryGetType(binary) != expected)
        return names;

    std::string_view symbols = section_contents(binary, ".dynsym");
    std::string_view strings = section_contents(binary, ".dynstr");

    for (size_t offset = 0; offset + sizeof(Elf64_Sym) <= symbols.size();
         offset += sizeof(Elf64_Sym)) {
        Elf64_Sym sym;
        std::memcpy(&sym, symbols.data() + offset, sizeof(sym));

        unsigned char bind = ELF64_ST_BIND(sym.st_info);
        unsigned char visibility = ELF64_ST_VISIBILITY(sym.st_other);
        if (sym.st_shndx == SHN_UNDEF || sym.st_name == 0 || sym.st_name >= strings.size())
            continue;
        if (bind != STB_GLOBAL && bind != STB_WEAK)
            continue;
        if (visibility != STV_DEFAULT && visibility != STV_PROTECTED)
            continue;

        std::string_view name = strings.substr(sym.st_name);
        name = name.substr(0, name.find('\0'));
        if (!name.empty()) {
            names.emplace_back(name);
        }
    }
#else
    // Mach-O exports are listed in .symtab even after strip -x
    (void)binary;
#endif
    return names;
}

} // namespace

Result<std::vector<std::string>, std::string>
read_exported_symbols(const fs::path& artifact) {
    LLVMMemoryBufferRef buffer = nullptr;
    char* message = nullptr;

    if (LLVMCreateMemoryBufferWithContentsOfFile(artifact.c_str(), &buffer, &message)) {
        std::string err = message ? message : "unknown error";
        LLVMDisposeMessage(message);
        return "Failed to read " + artifact.string() + ": " + err;
    }

    LLVMBinaryRef binary = LLVMCreateBinary(buffer, nullptr, &message);
    if (!binary) {
        std::string err = message ? message : "unknown error";
        LLVMDisposeMessage(message);
        LLVMDisposeMemoryBuffer(buffer);
        return "Not an object file: " + artifact.string() + ": " + err;
    }

    std::vector<std::string> names = read_static_symbols(binary);
    if (names.empty()) {
        names = read_dynamic_symbols(binary);
        SIMFORGE_LOG_DEBUG("loader", "No .symtab in " << artifact.filename().string()
                                                      << ", read " << names.size()
                                                      << " dynamic symbol(s)");
    }

    LLVMDisposeBinary(binary);
    LLVMDisposeMemoryBuffer(buffer);
    return names;
}

// ============================================================================
// ArtifactLoader
// ============================================================================

ArtifactLoader& ArtifactLoader::global() {
    static ArtifactLoader loader;
    return loader;
}

void* ArtifactLoader::dl_open(const fs::path& path) {
    // RTLD_NOW: unresolved references fail here, not mid-step in the sim loop
    return dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
}

std::string ArtifactLoader::dl_error() {
    const char* err = dlerror();
    return err ? err : "Unknown dlopen error";
}

Result<LoadedArtifact*, build::BuildError> ArtifactLoader::load(const std::string& name,
                                                               const fs::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = loaded_.find(name);
    if (it != loaded_.end()) {
        SIMFORGE_LOG_DEBUG("loader", "'" << name << "' already loaded");
        return it->second.get();
    }

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return build::BuildError::load("Artifact not found: " + path.string());
    }

    void* handle = dl_open(fs::absolute(path, ec));
    if (!handle) {
        std::string err = dl_error();
        SIMFORGE_LOG_ERROR("loader", "Failed to load '" << name << "': " << err);
        return build::BuildError::load("Failed to load " + path.string() + ": " + err);
    }

    auto artifact = std::make_unique<LoadedArtifact>(name, path, handle);
    auto* raw = artifact.get();
    loaded_.emplace(name, std::move(artifact));

    SIMFORGE_LOG_DEBUG("loader", "Loaded '" << name << "' from " << path.string());
    return raw;
}

LoadedArtifact* ArtifactLoader::get(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = loaded_.find(name);
    return it == loaded_.end() ? nullptr : it->second.get();
}

bool ArtifactLoader::is_loaded(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_.count(name) > 0;
}

size_t ArtifactLoader::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_.size();
}

} // namespace simforge::loader
