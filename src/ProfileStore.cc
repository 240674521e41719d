#include "ProfileStore.hh"
#include "Logger.hh"

#include <filesystem>
#include <format>
#include <fstream>

namespace fs = filesystem;

ProfileStore::ProfileStore(string filename) : filename(std::move(filename))
{
    load();
}

string ProfileStore::isoNow()
{
    auto now = chrono::time_point_cast<chrono::seconds>(chrono::system_clock::now());
    return format("{:%Y-%m-%dT%H:%M:%S}", now);
}

bool ProfileStore::load()
{
    lock_guard<mutex> lock(mtx);

    if (!fs::exists(filename))
    {
        profiles = json::object();
        return true;
    }

    ifstream in(filename);
    if (!in.is_open())
    {
        Logger::log(LogLevel::Error, "profiles", "cannot open " + filename);
        return false;
    }

    try
    {
        json loaded;
        in >> loaded;

        if (!loaded.is_object())
        {
            Logger::log(LogLevel::Error, "profiles", filename + " does not hold a JSON object");
            return false;
        }

        profiles = std::move(loaded);
    }
    catch (const json::exception &e)
    {
        Logger::log(LogLevel::Error, "profiles", string("failed to load profiles: ") + e.what());
        return false;
    }

    return true;
}

bool ProfileStore::saveLocked() const
{
    ofstream out(filename, ios::out | ios::trunc);
    if (!out.is_open())
    {
        Logger::log(LogLevel::Error, "profiles", "failed to save profiles to " + filename);
        return false;
    }

    out << profiles.dump(2, ' ', false, json::error_handler_t::replace) << '\n';
    return static_cast<bool>(out);
}

bool ProfileStore::createProfile(const string &name, const json &data)
{
    if (name.empty() || (!data.is_null() && !data.is_object()))
        return false;

    lock_guard<mutex> lock(mtx);

    if (profiles.contains(name))
    {
        Logger::log(LogLevel::Warn, "profiles", "profile " + name + " already exists");
        return false;
    }

    json record = data.is_object() ? data : json::object();
    string now = isoNow();
    record["created_at"] = now;
    record["updated_at"] = now;

    profiles[name] = std::move(record);

    if (!saveLocked())
        return false;

    Logger::log(LogLevel::Info, "profiles", "profile " + name + " created");
    return true;
}

bool ProfileStore::updateProfile(const string &name, const json &data)
{
    if (!data.is_object())
        return false;

    lock_guard<mutex> lock(mtx);

    if (!profiles.contains(name))
    {
        Logger::log(LogLevel::Warn, "profiles", "profile " + name + " not found");
        return false;
    }

    json &record = profiles[name];
    record.update(data);
    record["updated_at"] = isoNow();

    if (!saveLocked())
        return false;

    Logger::log(LogLevel::Info, "profiles", "profile " + name + " updated");
    return true;
}

bool ProfileStore::deleteProfile(const string &name)
{
    lock_guard<mutex> lock(mtx);

    if (!profiles.contains(name))
    {
        Logger::log(LogLevel::Warn, "profiles", "profile " + name + " not found");
        return false;
    }

    profiles.erase(name);

    if (!saveLocked())
        return false;

    Logger::log(LogLevel::Info, "profiles", "profile " + name + " deleted");
    return true;
}

optional<json> ProfileStore::getProfile(const string &name) const
{
    lock_guard<mutex> lock(mtx);

    if (!profiles.contains(name))
        return nullopt;

    return profiles.at(name);
}

vector<string> ProfileStore::listProfiles() const
{
    lock_guard<mutex> lock(mtx);

    vector<string> names;
    for (auto it = profiles.begin(); it != profiles.end(); ++it)
        names.push_back(it.key());

    return names;
}
