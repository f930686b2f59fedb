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


#ifndef _XSDBIND_XMLSCHEMA_HPP_
#define _XSDBIND_XMLSCHEMA_HPP_

#include <istream>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "SchemaRegistry.hpp"
#include "SchemaParser.hpp"
#include "ValidationContext.hpp"
#include "ValidationError.hpp"
#include "ErrorVisitor.hpp"
#include "Converter.hpp"
#include "XMLDocumentLoader.hpp"
#include "XmlElement.hpp"
#include "Status.hpp"
#include "Value.hpp"
#include "Exports.hpp"

namespace xsdbind
{

//
// Loads a schema once, then validates, decodes and encodes instances. All the instance
// operations are const and may be called concurrently once loadSchema has returned.
class XSDBIND_DECL_EXPORT XMLSchema
{
    public:

        XMLSchema() { }
        ~XMLSchema() { }

        bool loadSchema(const std::string &filename, const std::map<std::string, std::string> &params = std::map<std::string, std::string>());
        bool loadSchema(std::istream &in, const std::map<std::string, std::string> &params = std::map<std::string, std::string>());
        const std::string &getLastSchemaMessage() const { return m_message; }
        const Status &getBuildStatus() const { return m_buildStatus; }
        bool isLoaded() const { return m_pRegistry != nullptr; }
        const SchemaRegistry &getRegistry() const;
        SchemaComponent::validity getValidity() const;
        const ElementDecl *getElement(const std::string &name) const;
        const SchemaType *getType(const std::string &name) const;

        bool isValid(const XmlElement &root) const;
        void validate(const XmlElement &root) const;
        void iterErrors(const XmlElement &root, IErrorVisitor &visitor) const;
        std::vector<ValidationError> getErrors(const XmlElement &root) const;

        Value decode(const XmlElement &root, ValidationContext::validationMode mode = ValidationContext::strict,
            const ConverterOptions &options = ConverterOptions(), std::vector<ValidationError> *pErrors = nullptr) const;
        std::shared_ptr<XmlElement> encode(const Value &value, const std::string &elementName, ValidationContext::validationMode mode = ValidationContext::strict,
            const ConverterOptions &options = ConverterOptions(), std::vector<ValidationError> *pErrors = nullptr, bool unordered = false) const;

        std::shared_ptr<XmlElement> loadDocument(const std::string &filename) const { return m_loader.load(filename); }
        std::shared_ptr<XmlElement> loadDocument(std::istream &in) const { return m_loader.load(in); }
        void saveDocument(std::ostream &out, const XmlElement &root, const std::map<std::string, std::string> &namespaces = std::map<std::string, std::string>(), bool pretty = false) const;


    protected:

        bool finishLoad(const SchemaParser &parser, const std::shared_ptr<SchemaRegistry> &pRegistry, bool rc);
        Value doDecode(const XmlElement &root, ValidationContext &ctx) const;
        const ElementDecl *findRootDecl(const std::string &name, ValidationContext &ctx, bool isEncode) const;


    private:

        std::shared_ptr<SchemaRegistry> m_pRegistry;
        Status m_buildStatus;
        std::string m_message;
        XMLDocumentLoader m_loader;
};

}

#endif // _XSDBIND_XMLSCHEMA_HPP_
