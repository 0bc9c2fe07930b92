#include "theme_repository.hpp"
#include <algorithm>
#include <filesystem>
#include <glibmm.h>
#include <set>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

// ============================================================================
// Anonymous Namespace - Internal Helper Functions
// ============================================================================

namespace
{
/** Longest name a single path component may have on the filesystems we target. */
constexpr std::size_t MAX_THEME_ID_LENGTH = 255;

/**
 * Turns a configured root into the absolute, lexically normal form used for
 * every bundle path.
 *
 * A trailing separator is dropped so that "themes/" and "themes" name the same
 * root, and bundle paths built from it compare equal.
 *
 * @param root The root as configured, possibly relative
 * @return Absolute root without a trailing separator, or empty for an empty root
 */
std::string normalizeRoot(const std::string &root)
{
    if (root.empty())
        return "";

    std::error_code ec;
    std::filesystem::path p = std::filesystem::absolute(root, ec);
    if (ec)
        p = root;
    p = p.lexically_normal();
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path())
        p = p.parent_path();
    return p.string();
}

/**
 * Reads an optional string member of the manifest.
 *
 * Absent and null are both "not given". Any other non-string type makes the
 * manifest invalid rather than being coerced.
 *
 * @param j The manifest object
 * @param key Member name
 * @param out Receives the value when present
 * @param error Receives the reason on failure
 * @return False only if the member exists with the wrong type
 */
bool readOptionalString(const json &j, const char *key, std::string &out, std::string *error)
{
    if (!j.contains(key) || j[key].is_null())
        return true;
    if (!j[key].is_string())
    {
        if (error)
            *error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

/** Comma-separated list for messages, e.g. "alacritty.toml, kitty.conf". */
std::string joinNames(const std::vector<std::string> &names)
{
    std::string out;
    for (const auto &n : names)
    {
        if (!out.empty())
            out += ", ";
        out += n;
    }
    return out;
}
} // namespace

// ============================================================================
// ThemeRepository Implementation
// ============================================================================

ThemeRepository::ThemeRepository(std::string themesRoot, BundleFileSet fileSet, std::string customRoot)
    : m_root(normalizeRoot(themesRoot)), m_customRoot(normalizeRoot(customRoot)), m_fileSet(std::move(fileSet))
{
    // Whatever the configured file set says, the manifest defines a bundle.
    m_fileSet[MANIFEST_FILE] = FileRequirement::Required;

    // The same directory configured twice is just one root.
    if (m_customRoot == m_root)
        m_customRoot.clear();
}

ThemeRepository::~ThemeRepository()
{
    // Monitors must not call back into a destroyed repository.
    unwatch();
}

std::vector<std::pair<std::string, bool>> ThemeRepository::roots() const
{
    std::vector<std::pair<std::string, bool>> result = {{m_root, false}};
    if (!m_customRoot.empty())
        result.emplace_back(m_customRoot, true);
    return result;
}

bool ThemeRepository::isSafeThemeId(const std::string &themeId)
{
    if (themeId.empty() || themeId.size() > MAX_THEME_ID_LENGTH)
        return false;

    // Hidden entries are never bundles; this also rules out "." and "..".
    if (themeId[0] == '.')
        return false;

    // Separators would let an id walk out of the root; control characters
    // (NUL included) have no place in a directory name we hand to a hook.
    for (unsigned char c : themeId)
    {
        if (c == '/' || c == '\\' || c < 0x20 || c == 0x7f)
            return false;
    }
    return true;
}

bool ThemeRepository::locate(const std::string &themeId, std::string &root, bool &isCustom) const
{
    for (const auto &candidate : roots())
    {
        if (Glib::file_test(Glib::build_filename(candidate.first, themeId), Glib::FileTest::IS_DIR))
        {
            root = candidate.first;
            isCustom = candidate.second;
            return true;
        }
    }
    return false;
}

std::string ThemeRepository::pathFor(const std::string &themeId) const
{
    if (!isSafeThemeId(themeId))
        return "";

    std::string root = m_root;
    bool isCustom = false;
    locate(themeId, root, isCustom);
    return Glib::build_filename(root, themeId);
}

void ThemeRepository::setDiagnosticCallback(DiagnosticCallback callback)
{
    m_diagnostics = std::move(callback);
}

void ThemeRepository::report(const std::string &entry, const std::string &reason) const
{
    if (m_diagnostics)
        m_diagnostics(entry, reason);
    else
        spdlog::warn("[Repository] Skipping '{}': {}", entry, reason);
}

bool ThemeRepository::parseManifest(const std::string &path, ThemeManifest &out, std::string *error)
{
    json j;
    try
    {
        j = json::parse(Glib::file_get_contents(path));
    }
    catch (const Glib::Error &e)
    {
        if (error)
            *error = e.what();
        return false;
    }
    catch (const json::exception &e)
    {
        if (error)
            *error = std::string("invalid JSON: ") + e.what();
        return false;
    }

    if (!j.is_object())
    {
        if (error)
            *error = "manifest is not a JSON object";
        return false;
    }

    if (!j.contains("name") || !j["name"].is_string() || j["name"].get<std::string>().empty())
    {
        if (error)
            *error = "'name' is missing or empty";
        return false;
    }
    out.name = j["name"].get<std::string>();

    if (!readOptionalString(j, "author", out.author, error) ||
        !readOptionalString(j, "description", out.description, error) ||
        !readOptionalString(j, "version", out.version, error))
        return false;

    // Only presence is checked here; the palette itself belongs to the apps.
    if (!j.contains("colors") || !j["colors"].is_object() || j["colors"].empty())
    {
        if (error)
            *error = "'colors' is missing or empty";
        return false;
    }
    out.colors = j["colors"];

    out.requiredFiles.clear();
    if (j.contains("requiredFiles"))
    {
        if (!j["requiredFiles"].is_array())
        {
            if (error)
                *error = "'requiredFiles' must be an array";
            return false;
        }

        // A manifest may only name files inside its own bundle.
        for (const auto &f : j["requiredFiles"])
        {
            if (!f.is_string() || !isSafeThemeId(f.get<std::string>()))
            {
                if (error)
                    *error = "'requiredFiles' entries must be plain file names";
                return false;
            }
            out.requiredFiles.push_back(f.get<std::string>());
        }
    }

    return true;
}

/**
 * Loads one bundle from disk.
 *
 * Returns false only when the manifest is absent or unreadable. A bundle whose
 * manifest is fine but which lacks required files loads successfully with
 * missingFiles filled in, so it can still be listed.
 */
bool ThemeRepository::loadBundle(const std::string &root, const std::string &themeId, bool isCustom,
                                 ThemeBundle &out, std::string *error) const
{
    out = ThemeBundle();
    out.id = themeId;
    out.path = Glib::build_filename(root, themeId);
    out.isCustom = isCustom;

    const std::string manifestPath = Glib::build_filename(out.path, MANIFEST_FILE);
    if (!Glib::file_test(manifestPath, Glib::FileTest::IS_REGULAR))
    {
        if (error)
            *error = std::string("missing ") + MANIFEST_FILE;
        out.missingFiles.push_back(MANIFEST_FILE);
        return false;
    }

    if (!parseManifest(manifestPath, out.manifest, error))
        return false;

    // The manifest can only add to the required set, never relax it.
    BundleFileSet wanted = m_fileSet;
    for (const auto &f : out.manifest.requiredFiles)
        wanted[f] = FileRequirement::Required;

    for (const auto &entry : wanted)
    {
        const std::string filePath = Glib::build_filename(out.path, entry.first);
        if (Glib::file_test(filePath, Glib::FileTest::IS_REGULAR))
            out.files[entry.first] = filePath;
        else if (entry.second == FileRequirement::Required)
            out.missingFiles.push_back(entry.first);
    }

    out.isLight = Glib::file_test(Glib::build_filename(out.path, LIGHT_MODE_MARKER), Glib::FileTest::EXISTS);
    return true;
}

std::vector<ThemeBundle> ThemeRepository::list() const
{
    std::vector<ThemeBundle> result;
    std::set<std::string> seen;

    for (const auto &root : roots())
    {
        std::vector<std::string> names;
        try
        {
            Glib::Dir dir(root.first);
            for (std::string name = dir.read_name(); !name.empty(); name = dir.read_name())
                names.push_back(name);
        }
        catch (const Glib::FileError &e)
        {
            // A missing custom root is normal; a missing bundled root is worth a word.
            if (root.second)
                spdlog::debug("[Repository] No custom themes at {}: {}", root.first, e.what());
            else
                spdlog::warn("[Repository] Cannot read themes root {}: {}", root.first, e.what());
            continue;
        }

        std::sort(names.begin(), names.end());

        for (const auto &name : names)
        {
            if (name[0] == '.')
                continue;
            if (!Glib::file_test(Glib::build_filename(root.first, name), Glib::FileTest::IS_DIR))
                continue;
            if (!isSafeThemeId(name))
            {
                report(name, "directory name is not a valid theme id");
                continue;
            }
            if (seen.count(name))
            {
                report(name, "custom theme is shadowed by a bundled theme with the same id");
                continue;
            }
            // Claimed even if it fails to load, matching the lookup order of validate().
            seen.insert(name);

            ThemeBundle bundle;
            std::string error;
            if (!loadBundle(root.first, name, root.second, bundle, &error))
            {
                report(name, error);
                continue;
            }

            if (!bundle.isComplete())
                spdlog::debug("[Repository] '{}' is missing {}", name, joinNames(bundle.missingFiles));

            result.push_back(std::move(bundle));
        }
    }

    std::sort(result.begin(), result.end(),
              [](const ThemeBundle &a, const ThemeBundle &b) { return a.id < b.id; });
    return result;
}

ValidationResult ThemeRepository::validate(const std::string &themeId) const
{
    ValidationResult result;

    // Rejected before anything touches the filesystem.
    if (!isSafeThemeId(themeId))
    {
        result.error = ErrorCode::InvalidThemeId;
        result.message = "'" + themeId + "' is not a valid theme id";
        return result;
    }

    std::string root;
    bool isCustom = false;
    if (!locate(themeId, root, isCustom))
    {
        result.error = ErrorCode::NotFound;
        result.message = "Theme \"" + themeId + "\" not found";
        return result;
    }

    std::string error;
    if (!loadBundle(root, themeId, isCustom, result.bundle, &error))
    {
        result.error = ErrorCode::InvalidBundle;
        result.message = "Theme \"" + themeId + "\": " + error;
        return result;
    }

    if (!result.bundle.isComplete())
    {
        result.error = ErrorCode::InvalidBundle;
        result.message = "Theme \"" + themeId + "\" is missing " + joinNames(result.bundle.missingFiles);
        return result;
    }

    return result;
}

void ThemeRepository::watch(ChangedCallback callback)
{
    m_callback = std::move(callback);

    // Start from a clean slate so a second watch() never doubles the callbacks.
    unwatch();

    for (const auto &root : roots())
        watchRoot(root.first);
}

/**
 * Attaches a directory monitor to one root.
 *
 * Only events that can change the catalog are forwarded. A root that does not
 * exist yet is still monitored, so creating it later is noticed.
 */
void ThemeRepository::watchRoot(const std::string &root)
{
    try
    {
        RootWatch watch;
        watch.monitor = Gio::File::create_for_path(root)->monitor_directory();

        watch.conn = watch.monitor->signal_changed().connect(
            [this](const Glib::RefPtr<Gio::File> &file, const Glib::RefPtr<Gio::File> &,
                   Gio::FileMonitor::Event event)
            {
                switch (event)
                {
                case Gio::FileMonitor::Event::CREATED:
                case Gio::FileMonitor::Event::DELETED:
                case Gio::FileMonitor::Event::CHANGES_DONE_HINT:
                case Gio::FileMonitor::Event::MOVED_IN:
                case Gio::FileMonitor::Event::MOVED_OUT:
                case Gio::FileMonitor::Event::RENAMED:
                    break;
                default:
                    return;
                }

                spdlog::debug("[Repository] Change under themes root: {}",
                              file ? file->get_basename() : std::string("?"));
                if (m_callback)
                    m_callback();
            });

        m_watches.push_back(std::move(watch));
    }
    catch (const Glib::Error &e)
    {
        spdlog::warn("[Repository] Cannot watch {}: {}", root, e.what());
    }
}

void ThemeRepository::unwatch()
{
    // Disconnect first so a change already queued on the main loop finds no slot.
    for (auto &watch : m_watches)
    {
        watch.conn.disconnect();
        if (watch.monitor)
            watch.monitor->cancel();
    }
    m_watches.clear();
}
