#pragma once

// Shaderlay - Shader Catalog
// Insertion-ordered registry of shader sources with one active selection

#include <shaderlay/shader_source.h>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace shaderlay {

// Reads a shader file; returns nullopt (and fills `error`) on failure
using FileReader = std::function<std::optional<std::string>(const std::string& path,
                                                            std::string& error)>;

class ShaderCatalog {
public:
    using ListChangedCallback = std::function<void()>;
    using SelectionCallback = std::function<void(const ShaderSource& source)>;

    ShaderCatalog() = default;

    // Non-copyable
    ShaderCatalog(const ShaderCatalog&) = delete;
    ShaderCatalog& operator=(const ShaderCatalog&) = delete;

    // Insert, or replace in place when the id already exists
    std::string add(ShaderSource source);

    // Returns false if absent. Removing the current entry clears the selection.
    bool remove(const std::string& id);

    // Returns false (selection unchanged) if absent
    bool select(const std::string& id);

    std::vector<ShaderInfo> list() const;
    std::optional<std::string> current() const { return m_currentId; }

    const ShaderSource* find(const std::string& id) const;
    const ShaderSource* currentSource() const;
    bool contains(const std::string& id) const { return find(id) != nullptr; }
    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    // Bring directory-scan entries in line with `paths`: drop entries whose
    // file is gone, add entries for new files, reload changed ones. Other
    // origins are never touched. Emits exactly one list-changed notification,
    // then reselects the current entry if its file changed, or selects the
    // first entry if nothing is selected. Files that fail to read are skipped.
    void reconcile(const std::vector<std::string>& paths, const FileReader& reader);

    // Fired after entries are added, replaced or removed
    void setListChangedCallback(ListChangedCallback callback) { m_onListChanged = std::move(callback); }

    // Fired after a successful select()
    void setSelectionCallback(SelectionCallback callback) { m_onSelected = std::move(callback); }

    static std::string idForPath(const std::string& path);
    static std::string nameForPath(const std::string& path);

private:
    std::vector<ShaderSource>::iterator findEntry(const std::string& id);
    void notifyListChanged();

    std::vector<ShaderSource> m_entries;
    std::optional<std::string> m_currentId;

    ListChangedCallback m_onListChanged;
    SelectionCallback m_onSelected;
    bool m_batching = false;
};

} // namespace shaderlay
