// person_registry.hpp
#ifndef PRESENCEFILTER_PERSON_REGISTRY_HPP_
#define PRESENCEFILTER_PERSON_REGISTRY_HPP_

// Standard Library Headers
#include <algorithm> // For std::find
#include <map>
#include <mutex>     // For std::mutex, std::lock_guard
#include <optional>  // For std::optional (C++17)
#include <string>
#include <vector>

// Project-specific Headers
#include "common_types.hpp" // For ConfigurationError

/**
 * @brief A person carrying one or more tracked devices.
 *
 * The person is located through the active device, which is always one of the
 * linked devices.
 */
struct Person {
    std::string id;
    std::string name;
    std::string active_device_id;
    std::vector<std::string> linked_device_ids; // In link order
};

/**
 * @brief Owns the person to device associations.
 *
 * Writes are validated before they are applied and every method is thread-safe.
 * Operations on an unknown person throw ConfigurationError, except updatePerson()
 * and removePerson(), which report it through their return value.
 */
class PersonRegistry {
public:
    /**
     * @brief Adds a person. The active device is linked if the list omits it.
     * @throws ConfigurationError if the person is invalid or the id is taken.
     */
    void addPerson(const Person& person) {
        Person normalized = normalize(person);
        std::lock_guard<std::mutex> lock(mutex_);
        if (persons_.count(normalized.id) != 0) {
            throw ConfigurationError("person '" + normalized.id + "' already exists");
        }
        persons_.emplace(normalized.id, normalized);
    }

    /**
     * @brief Replaces an existing person.
     * @return False if the id is unknown.
     * @throws ConfigurationError if the person is invalid.
     */
    bool updatePerson(const Person& person) {
        Person normalized = normalize(person);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = persons_.find(normalized.id);
        if (it == persons_.end()) return false;
        it->second = normalized;
        return true;
    }

    bool removePerson(const std::string& person_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return persons_.erase(person_id) > 0;
    }

    /**
     * @return True if the device was newly linked.
     */
    bool linkDevice(const std::string& person_id, const std::string& device_id) {
        if (device_id.empty()) {
            throw ConfigurationError("device id must not be empty");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        Person& person = find(person_id);
        if (isLinked(person, device_id)) return false;
        person.linked_device_ids.push_back(device_id);
        return true;
    }

    /**
     * @return True if the device was linked and is now unlinked.
     * @throws ConfigurationError for the active device; make another device active first.
     */
    bool unlinkDevice(const std::string& person_id, const std::string& device_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        Person& person = find(person_id);
        if (device_id == person.active_device_id) {
            throw ConfigurationError("cannot unlink the active device '" + device_id + "' of person '" +
                                     person_id + "'");
        }
        auto it = std::find(person.linked_device_ids.begin(), person.linked_device_ids.end(), device_id);
        if (it == person.linked_device_ids.end()) return false;
        person.linked_device_ids.erase(it);
        return true;
    }

    /**
     * @return True if the active device changed.
     * @throws ConfigurationError if the device is not linked to the person.
     */
    bool setActiveDevice(const std::string& person_id, const std::string& device_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        Person& person = find(person_id);
        if (!isLinked(person, device_id)) {
            throw ConfigurationError("device '" + device_id + "' is not linked to person '" + person_id + "'");
        }
        if (person.active_device_id == device_id) return false;
        person.active_device_id = device_id;
        return true;
    }

    std::optional<Person> getPerson(const std::string& person_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = persons_.find(person_id);
        if (it == persons_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<std::string> activeDevice(const std::string& person_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = persons_.find(person_id);
        if (it == persons_.end()) return std::nullopt;
        return it->second.active_device_id;
    }

    // Persons the device is linked to, sorted by id.
    std::vector<std::string> personsOf(const std::string& device_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> ids;
        for (const auto& entry : persons_) {
            if (isLinked(entry.second, device_id)) ids.push_back(entry.first);
        }
        return ids;
    }

    std::vector<Person> allPersons() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Person> out;
        out.reserve(persons_.size());
        for (const auto& entry : persons_) out.push_back(entry.second);
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return persons_.size();
    }

private:
    std::map<std::string, Person> persons_;
    mutable std::mutex mutex_;

    static bool isLinked(const Person& person, const std::string& device_id) {
        return std::find(person.linked_device_ids.begin(), person.linked_device_ids.end(), device_id) !=
               person.linked_device_ids.end();
    }

    static Person normalize(const Person& person) {
        if (person.id.empty()) {
            throw ConfigurationError("person id must not be empty");
        }
        if (person.active_device_id.empty()) {
            throw ConfigurationError("person '" + person.id + "' needs an active device");
        }
        Person normalized = person;
        normalized.linked_device_ids.clear();
        for (const auto& device_id : person.linked_device_ids) {
            if (device_id.empty()) {
                throw ConfigurationError("person '" + person.id + "' links an empty device id");
            }
            if (!isLinked(normalized, device_id)) normalized.linked_device_ids.push_back(device_id);
        }
        if (!isLinked(normalized, normalized.active_device_id)) {
            normalized.linked_device_ids.push_back(normalized.active_device_id);
        }
        return normalized;
    }

    // Caller holds mutex_.
    Person& find(const std::string& person_id) {
        auto it = persons_.find(person_id);
        if (it == persons_.end()) {
            throw ConfigurationError("person '" + person_id + "' does not exist");
        }
        return it->second;
    }
};

#endif // PRESENCEFILTER_PERSON_REGISTRY_HPP_
