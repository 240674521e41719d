#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using namespace std;
using json = nlohmann::json;

/*
Named profile records kept in one JSON file ({ "name": { ...fields, created_at, updated_at } }).
The file is rewritten after every change. I/O problems are logged and reported as false.
*/
class ProfileStore
{
public:
    explicit ProfileStore(string filename);

    // Re-read the file; a missing file is an empty store
    bool load();

    bool createProfile(const string &name, const json &data);

    // Merge the given fields into an existing profile
    bool updateProfile(const string &name, const json &data);

    bool deleteProfile(const string &name);

    optional<json> getProfile(const string &name) const;
    vector<string> listProfiles() const;

    const string &file() const noexcept { return filename; }

private:
    bool saveLocked() const;
    static string isoNow();

    const string filename;
    mutable mutex mtx;
    json profiles = json::object();
};
