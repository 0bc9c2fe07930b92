#ifndef THEME_REPOSITORY_HPP
#define THEME_REPOSITORY_HPP

#include "errors.hpp"
#include "preferences.hpp"
#include <functional>
#include <giomm.h>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

/** Parsed theme.json. colors is kept opaque; only its presence is checked. */
struct ThemeManifest
{
    std::string name;
    std::string author;
    std::string description;
    std::string version;
    nlohmann::json colors;
    std::vector<std::string> requiredFiles;
};

/** One installed theme directory. */
struct ThemeBundle
{
    std::string id;
    std::string path;
    ThemeManifest manifest;
    /** Logical file name -> absolute path, for every known file that exists. */
    std::map<std::string, std::string> files;
    /** Required files that are absent. Non-empty means the bundle is invalid. */
    std::vector<std::string> missingFiles;
    bool isLight = false;
    /** Found under the custom-themes root rather than the bundled one. */
    bool isCustom = false;

    bool isComplete() const { return missingFiles.empty(); }
};

struct ValidationResult
{
    ErrorCode error = ErrorCode::None;
    ThemeBundle bundle;
    std::string message;

    bool ok() const { return error == ErrorCode::None; }
};

/**
 * Read-only catalog of the bundles under the themes root and, optionally, a
 * second root holding the user's own themes.
 *
 * Ids are unique across both roots. When the same id exists in both, the
 * bundled theme wins and the custom one is reported as shadowed.
 *
 * Nothing is cached: every call goes back to the filesystem, so a bundle that
 * was edited or removed since the last listing is seen as it is now.
 */
class ThemeRepository
{
  public:
    using DiagnosticCallback = std::function<void(const std::string &entry, const std::string &reason)>;
    using ChangedCallback = std::function<void()>;

    static constexpr const char *MANIFEST_FILE = "theme.json";
    static constexpr const char *LIGHT_MODE_MARKER = "light.mode";

    /** customRoot may be empty, in which case only themesRoot is searched. */
    ThemeRepository(std::string themesRoot, BundleFileSet fileSet, std::string customRoot = "");
    ~ThemeRepository();

    ThemeRepository(const ThemeRepository &) = delete;
    ThemeRepository &operator=(const ThemeRepository &) = delete;

    const std::string &root() const { return m_root; }
    const std::string &customRoot() const { return m_customRoot; }

    /**
     * Every discoverable bundle, sorted by id. Entries without a readable
     * manifest are left out and reported through the diagnostics callback.
     */
    std::vector<ThemeBundle> list() const;

    /** Re-read the bundle and check its manifest and required files. */
    ValidationResult validate(const std::string &themeId) const;

    /** Resolve a theme id to its bundle; same checks as validate(). */
    ValidationResult get(const std::string &themeId) const { return validate(themeId); }

    /**
     * Absolute bundle path for an id, or empty if the id is unsafe. An id that
     * exists in neither root maps into the bundled root.
     */
    std::string pathFor(const std::string &themeId) const;

    /** True if themeId is a plain directory name that cannot escape the root. */
    static bool isSafeThemeId(const std::string &themeId);

    static bool parseManifest(const std::string &path, ThemeManifest &out, std::string *error);

    /** Defaults to a spdlog warning. */
    void setDiagnosticCallback(DiagnosticCallback callback);

    /** Watch both roots for added, removed or edited bundles. Idempotent. */
    void watch(ChangedCallback callback);
    void unwatch();

  private:
    struct RootWatch
    {
        Glib::RefPtr<Gio::FileMonitor> monitor;
        sigc::connection conn;
    };

    /** Roots in lookup order, paired with their isCustom flag. */
    std::vector<std::pair<std::string, bool>> roots() const;
    bool locate(const std::string &themeId, std::string &root, bool &isCustom) const;
    bool loadBundle(const std::string &root, const std::string &themeId, bool isCustom, ThemeBundle &out,
                    std::string *error) const;
    void watchRoot(const std::string &root);
    void report(const std::string &entry, const std::string &reason) const;

    std::string m_root;
    std::string m_customRoot;
    BundleFileSet m_fileSet;
    DiagnosticCallback m_diagnostics;

    std::vector<RootWatch> m_watches;
    ChangedCallback m_callback;
};

#endif // THEME_REPOSITORY_HPP
