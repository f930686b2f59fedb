/*##############################################################################

    HPCC SYSTEMS software Copyright (C) 2017 HPCC Systems®.

    Licensed under the Apache License, Version 2.0 (the "License");
    you may not use this file except in compliance with the License.
    You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

    Unless required by applicable law or agreed to in writing, software
    distributed under the License is distributed on an "AS IS" BASIS,
    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
    See the License for the specific language governing permissions and
    limitations under the License.
############################################################################## */


#ifndef _XSDBIND_CONVERTER_HPP_
#define _XSDBIND_CONVERTER_HPP_

#include <map>
#include <string>
#include <utility>
#include <vector>
#include "Value.hpp"
#include "Exports.hpp"

namespace xsdbind
{

class ElementDecl;
class SchemaType;

struct XSDBIND_DECL_EXPORT ConverterOptions
{
    enum mapOrder
    {
        insertionOrder = 0,
        sortedKeys
    };

    ConverterOptions() : order(insertionOrder), useAttrPrefix(true), attrPrefix("@"), textKey("$"), useCDataPrefix(false), useDefaults(true) { }

    //
    // Throws ValueException when a prefix or key could clash with an element or attribute name
    void check() const;

    mapOrder order;
    bool useAttrPrefix;                             // false drops attributes from decoded values
    std::string attrPrefix;
    std::string textKey;
    bool useCDataPrefix;                            // false drops mixed content text
    std::string cdataPrefix;
    std::map<std::string, std::string> namespaces;  // prefix to URI, used to shorten qualified names
    bool useDefaults;
};


//
// One decoded child element, or one run of mixed content text when pDecl is null and
// cdataIndex is set (1 for the text before the first child, then one per tail).
struct XSDBIND_DECL_EXPORT ContentItem
{
    ContentItem(const std::string &_name, const Value &_value, const ElementDecl *_pDecl, bool _single) :
        name(_name), cdataIndex(0), value(_value), pDecl(_pDecl), single(_single) { }
    ContentItem(unsigned _cdataIndex, const Value &_value) :
        cdataIndex(_cdataIndex), value(_value), pDecl(nullptr), single(true) { }

    bool isCData() const { return cdataIndex != 0; }

    std::string name;
    unsigned cdataIndex;
    Value value;
    const ElementDecl *pDecl;
    bool single;            // the child can appear at most once in its parent
};


struct XSDBIND_DECL_EXPORT ElementData
{
    std::string tag;
    Value text;             // null when the element has no simple value
    std::vector<ContentItem> content;
    std::vector<std::pair<std::string, Value>> attributes;
};


//
// Shapes decoded element data into a native value and back. Called once per element
// boundary, children first on decode and parents first on encode.
class XSDBIND_DECL_EXPORT IConverter
{
    public:

        virtual ~IConverter() { }
        virtual const ConverterOptions &getOptions() const = 0;
        virtual Value elementDecode(const ElementData &data, const ElementDecl &decl, const SchemaType &type, unsigned level) const = 0;

        //
        // Throws ValueException when the value does not have the shape the declaration needs
        virtual ElementData elementEncode(const Value &obj, const ElementDecl &decl, const SchemaType &type, unsigned level) const = 0;
};


//
// Maps with attribute keys under the attribute prefix, the text under the text key when there
// are attributes too, and repeated children collected into lists.
class XSDBIND_DECL_EXPORT DefaultConverter : public IConverter
{
    public:

        DefaultConverter();
        DefaultConverter(const ConverterOptions &options);
        virtual ~DefaultConverter() { }

        virtual const ConverterOptions &getOptions() const { return m_options; }
        virtual Value elementDecode(const ElementData &data, const ElementDecl &decl, const SchemaType &type, unsigned level) const;
        virtual ElementData elementEncode(const Value &obj, const ElementDecl &decl, const SchemaType &type, unsigned level) const;

        //
        // {uri}local to prefix:local using the namespace map, and the inverse
        std::string mapQName(const std::string &qname) const;
        std::string unmapQName(const std::string &name) const;


    protected:

        void finishMap(Value &map) const;
        bool isCDataKey(const std::string &key, unsigned &index) const;


    private:

        ConverterOptions m_options;
};

}

#endif // _XSDBIND_CONVERTER_HPP_
