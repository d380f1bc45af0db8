/**
 * @file test_records.hpp
 * @brief Record interfaces shared by the DynRec tests
 */

#pragma once

#include "dynrec/dynrec.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace test_records {

enum class Color { Red, Green, Blue };

class Address : public dynrec::DynamicRecord<Address> {
public:
    using DynamicRecord::DynamicRecord;

    std::string getStreet() const { return invoke<std::string>("getStreet"); }
    void setStreet(const std::string& v) { invoke("setStreet", v); }

    std::optional<std::string> getCity() const { return invoke<std::optional<std::string>>("getCity"); }
    void setCity(const std::optional<std::string>& v) { invoke("setCity", v); }

    static dynrec::InterfaceDescriptor describe() {
        return dynrec::InterfaceBuilder<Address>()
            .in_namespace("test.records")
            .DYNREC_OPERATION(getStreet)
            .DYNREC_OPERATION(setStreet)
            .DYNREC_OPERATION(getCity, dynrec::Field{.required = false})
            .DYNREC_OPERATION(setCity);
    }
};

class Person : public dynrec::DynamicRecord<Person> {
public:
    using DynamicRecord::DynamicRecord;

    std::string getName() const { return invoke<std::string>("getName"); }
    void setName(const std::string& v) { invoke("setName", v); }

    std::optional<std::string> getNickname() const { return invoke<std::optional<std::string>>("getNickname"); }
    void setNickname(const std::optional<std::string>& v) { invoke("setNickname", v); }

    int32_t getAge() const { return invoke<int32_t>("getAge"); }
    void setAge(int32_t v) { invoke("setAge", v); }

    bool isActive() const { return invoke<bool>("isActive"); }
    void setActive(bool v) { invoke("setActive", v); }

    Color getFavorite() const { return invoke<Color>("getFavorite"); }
    void setFavorite(Color v) { invoke("setFavorite", v); }

    std::vector<std::string> getTags() const { return invoke<std::vector<std::string>>("getTags"); }
    void addToTags(const std::string& v) { invoke("addToTags", v); }
    bool removeFromTags(const std::string& v) { return invoke<bool>("removeFromTags", v); }

    std::map<std::string, int64_t> getScores() const { return invoke<std::map<std::string, int64_t>>("getScores"); }
    void putIntoScores(const std::string& key, int64_t v) { invoke("putIntoScores", key, v); }
    bool removeFromScores(const std::string& key) { return invoke<bool>("removeFromScores", key); }

    Address getAddress() const { return invoke<Address>("getAddress"); }
    void setAddress(const Address& v) { invoke("setAddress", v); }

    static dynrec::InterfaceDescriptor describe() {
        return dynrec::InterfaceBuilder<Person>()
            .in_namespace("test.records")
            .doc("A person")
            .DYNREC_OPERATION(getName, dynrec::Doc{"Full name"})
            .DYNREC_OPERATION(setName)
            .DYNREC_OPERATION(getNickname, dynrec::Field{.required = false}, dynrec::Alias{"alias"})
            .DYNREC_OPERATION(setNickname)
            .DYNREC_OPERATION(getAge)
            .DYNREC_OPERATION(setAge)
            .DYNREC_OPERATION(isActive)
            .DYNREC_OPERATION(setActive)
            .DYNREC_OPERATION(getFavorite)
            .DYNREC_OPERATION(setFavorite)
            .DYNREC_OPERATION(getTags)
            .DYNREC_OPERATION(addToTags)
            .DYNREC_OPERATION(removeFromTags)
            .DYNREC_OPERATION(getScores, dynrec::Field{.required = false})
            .DYNREC_OPERATION(putIntoScores)
            .DYNREC_OPERATION(removeFromScores)
            .DYNREC_OPERATION(getAddress)
            .DYNREC_OPERATION(setAddress);
    }
};

/// Singly linked list node, refers to itself
class Node : public dynrec::DynamicRecord<Node> {
public:
    using DynamicRecord::DynamicRecord;

    int64_t getValue() const { return invoke<int64_t>("getValue"); }
    void setValue(int64_t v) { invoke("setValue", v); }

    std::optional<Node> getNext() const { return invoke<std::optional<Node>>("getNext"); }
    void setNext(const std::optional<Node>& v) { invoke("setNext", v); }

    static dynrec::InterfaceDescriptor describe() {
        return dynrec::InterfaceBuilder<Node>()
            .in_namespace("test.records")
            .DYNREC_OPERATION(getValue)
            .DYNREC_OPERATION(setValue)
            .DYNREC_OPERATION(getNext, dynrec::Field{.required = false})
            .DYNREC_OPERATION(setNext);
    }
};

class OptionalRequired : public dynrec::DynamicRecord<OptionalRequired> {
public:
    using DynamicRecord::DynamicRecord;

    std::optional<std::string> getOptionalValue() const {
        return invoke<std::optional<std::string>>("getOptionalValue");
    }
    void setOptionalValue(const std::optional<std::string>& v) { invoke("setOptionalValue", v); }

    std::string getRequiredValue() const { return invoke<std::string>("getRequiredValue"); }
    void setRequiredValue(const std::string& v) { invoke("setRequiredValue", v); }

    static dynrec::InterfaceDescriptor describe() {
        return dynrec::InterfaceBuilder<OptionalRequired>()
            .DYNREC_OPERATION(getOptionalValue, dynrec::Field{.required = false})
            .DYNREC_OPERATION(setOptionalValue)
            .DYNREC_OPERATION(getRequiredValue, dynrec::Field{.required = true})
            .DYNREC_OPERATION(setRequiredValue);
    }
};

class Tagged : public dynrec::DynamicRecord<Tagged> {
public:
    using DynamicRecord::DynamicRecord;

    std::vector<std::string> getTags() const { return invoke<std::vector<std::string>>("getTags"); }
    void addToTags(const std::string& v) { invoke("addToTags", v); }

    static dynrec::InterfaceDescriptor describe() {
        return dynrec::InterfaceBuilder<Tagged>()
            .DYNREC_OPERATION(getTags)
            .DYNREC_OPERATION(addToTags);
    }
};

} // namespace test_records
