// Shaderlay - Shader Catalog Implementation

#include <shaderlay/shader_catalog.h>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <set>

namespace fs = std::filesystem;

namespace shaderlay {

std::string ShaderCatalog::idForPath(const std::string& path) {
    return "file-" + path;
}

std::string ShaderCatalog::nameForPath(const std::string& path) {
    return fs::path(path).stem().string();
}

std::vector<ShaderSource>::iterator ShaderCatalog::findEntry(const std::string& id) {
    return std::find_if(m_entries.begin(), m_entries.end(),
                        [&](const ShaderSource& s) { return s.id == id; });
}

const ShaderSource* ShaderCatalog::find(const std::string& id) const {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&](const ShaderSource& s) { return s.id == id; });
    return it != m_entries.end() ? &*it : nullptr;
}

const ShaderSource* ShaderCatalog::currentSource() const {
    return m_currentId ? find(*m_currentId) : nullptr;
}

std::string ShaderCatalog::add(ShaderSource source) {
    auto it = findEntry(source.id);
    if (it != m_entries.end()) {
        *it = std::move(source);
    } else {
        m_entries.push_back(std::move(source));
        it = std::prev(m_entries.end());
    }
    notifyListChanged();
    return it->id;
}

bool ShaderCatalog::remove(const std::string& id) {
    auto it = findEntry(id);
    if (it == m_entries.end()) {
        return false;
    }

    if (m_currentId && *m_currentId == id) {
        m_currentId.reset();
    }
    m_entries.erase(it);
    notifyListChanged();
    return true;
}

bool ShaderCatalog::select(const std::string& id) {
    const ShaderSource* source = find(id);
    if (!source) {
        std::cerr << "[Catalog] No shader with id: " << id << std::endl;
        return false;
    }

    m_currentId = id;
    std::cout << "[Catalog] Selected " << source->displayName << " (" << id << ")" << std::endl;
    if (m_onSelected) {
        m_onSelected(*source);
    }
    return true;
}

std::vector<ShaderInfo> ShaderCatalog::list() const {
    std::vector<ShaderInfo> result;
    result.reserve(m_entries.size());
    for (const auto& s : m_entries) {
        result.push_back({s.id, s.displayName, s.origin});
    }
    return result;
}

void ShaderCatalog::reconcile(const std::vector<std::string>& paths, const FileReader& reader) {
    std::set<std::string> present(paths.begin(), paths.end());
    bool reloadCurrent = false;
    int added = 0;
    int removed = 0;

    m_batching = true;

    // Entries whose file disappeared
    std::vector<std::string> gone;
    for (const auto& s : m_entries) {
        if (s.origin == ShaderOrigin::DirectoryScan && present.count(s.path) == 0) {
            gone.push_back(s.id);
        }
    }
    for (const auto& id : gone) {
        remove(id);
        removed++;
    }

    // New files, plus files whose contents changed
    for (const auto& path : paths) {
        const std::string id = idForPath(path);
        const ShaderSource* existing = find(id);
        if (existing && existing->origin != ShaderOrigin::DirectoryScan) {
            continue;
        }

        std::string error;
        std::optional<std::string> text = reader(path, error);
        if (!text) {
            std::cerr << "[Catalog] Skipping " << path << ": " << error << std::endl;
            continue;
        }

        if (!existing) {
            add({id, nameForPath(path), std::move(*text), ShaderOrigin::DirectoryScan, path});
            added++;
        } else if (existing->bodyText != *text) {
            add({id, existing->displayName, std::move(*text), ShaderOrigin::DirectoryScan, path});
            if (m_currentId && *m_currentId == id) {
                reloadCurrent = true;
            }
        }
    }

    m_batching = false;

    if (added > 0 || removed > 0) {
        std::cout << "[Catalog] Directory: " << added << " added, " << removed << " removed" << std::endl;
    }
    notifyListChanged();

    if (reloadCurrent) {
        std::cout << "[Catalog] Current shader changed on disk, reloading" << std::endl;
        select(*m_currentId);
    } else if (!m_currentId && !m_entries.empty()) {
        select(m_entries.front().id);
    }
}

void ShaderCatalog::notifyListChanged() {
    if (m_batching || !m_onListChanged) {
        return;
    }
    m_onListChanged();
}

} // namespace shaderlay
