#pragma once

/**
 * @file library_records.hpp
 * @brief Record interfaces shared by the DynRec examples
 */

#include <dynrec/dynrec.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace library {

enum class Genre { Fiction, Science, History, Poetry };

class Author : public dynrec::DynamicRecord<Author> {
public:
    using DynamicRecord::DynamicRecord;

    std::string getName() const { return invoke<std::string>("getName"); }
    void setName(const std::string& v) { invoke("setName", v); }

    std::optional<int32_t> getBorn() const { return invoke<std::optional<int32_t>>("getBorn"); }
    void setBorn(const std::optional<int32_t>& v) { invoke("setBorn", v); }

    static dynrec::InterfaceDescriptor describe() {
        return dynrec::InterfaceBuilder<Author>()
            .DYNREC_OPERATION(getName)
            .DYNREC_OPERATION(setName)
            .DYNREC_OPERATION(getBorn, dynrec::Field{.required = false}, dynrec::Doc{"Year of birth"})
            .DYNREC_OPERATION(setBorn);
    }
};

class Book : public dynrec::DynamicRecord<Book> {
public:
    using DynamicRecord::DynamicRecord;

    std::string getTitle() const { return invoke<std::string>("getTitle"); }
    void setTitle(const std::string& v) { invoke("setTitle", v); }

    Genre getGenre() const { return invoke<Genre>("getGenre"); }
    void setGenre(Genre v) { invoke("setGenre", v); }

    Author getAuthor() const { return invoke<Author>("getAuthor"); }
    void setAuthor(const Author& v) { invoke("setAuthor", v); }

    std::vector<std::string> getKeywords() const { return invoke<std::vector<std::string>>("getKeywords"); }
    void addToKeywords(const std::string& v) { invoke("addToKeywords", v); }
    bool removeFromKeywords(const std::string& v) { return invoke<bool>("removeFromKeywords", v); }

    std::map<std::string, double> getRatings() const { return invoke<std::map<std::string, double>>("getRatings"); }
    void putIntoRatings(const std::string& source, double v) { invoke("putIntoRatings", source, v); }

    std::optional<std::string> getSubtitle() const { return invoke<std::optional<std::string>>("getSubtitle"); }
    void setSubtitle(const std::optional<std::string>& v) { invoke("setSubtitle", v); }

    static dynrec::InterfaceDescriptor describe() {
        return dynrec::InterfaceBuilder<Book>()
            .doc("A catalogued book")
            .DYNREC_OPERATION(getTitle, dynrec::Doc{"Main title"}, dynrec::Alias{"name"})
            .DYNREC_OPERATION(setTitle)
            .DYNREC_OPERATION(getGenre)
            .DYNREC_OPERATION(setGenre)
            .DYNREC_OPERATION(getAuthor)
            .DYNREC_OPERATION(setAuthor)
            .DYNREC_OPERATION(getKeywords)
            .DYNREC_OPERATION(addToKeywords, dynrec::Param{dynrec::Doc{"Search keywords"}})
            .DYNREC_OPERATION(removeFromKeywords)
            .DYNREC_OPERATION(getRatings, dynrec::Field{.required = false})
            .DYNREC_OPERATION(putIntoRatings)
            .DYNREC_OPERATION(getSubtitle, dynrec::Field{.required = false})
            .DYNREC_OPERATION(setSubtitle);
    }
};

} // namespace library
