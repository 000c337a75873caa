//
//  Copyright (c) 2013-2016 plan44.ch / Lukas Zeller, Zurich, Switzerland
//
//  Author: Lukas Zeller <luz@plan44.ch>
//
//  This file is part of dprobe.
//
//  dprobe is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  dprobe is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with dprobe. If not, see <http://www.gnu.org/licenses/>.
//


#ifndef __dprobe__jsonobject__
#define __dprobe__jsonobject__

#include "dp_common.hpp"

#include <json-c/json.h>

// compact, no spaces, no escaped slashes
#define JSON_TEXT_DEFAULT_FLAGS (JSON_C_TO_STRING_PLAIN|JSON_C_TO_STRING_NOSLASHESCAPE)

using namespace std;

namespace dprobe {


  // Errors
  typedef enum json_tokener_error JsonErrors;

  class JsonError : public Error
  {
  public:
    static const char *domain() { return "JsonObject"; }
    virtual const char *getErrorDomain() const { return JsonError::domain(); };
    JsonError(JsonErrors aError) : Error(ErrorCode(aError), json_tokener_error_desc(aError)) {};
    JsonError(JsonErrors aError, std::string aErrorMessage) : Error(ErrorCode(aError), aErrorMessage) {};
  };


  class JsonObject;

  /// shared pointer for JSON object
  typedef boost::intrusive_ptr<JsonObject> JsonObjectPtr;


  /// wrapper around json-c object
  /// @note a JSON null is represented by an empty JsonObjectPtr in all getters
  class JsonObject : public DpObj
  {
    struct json_object *json_obj; ///< the json-c object

    /// construct object as wrapper of json-c json_object.
    /// @param aObjPassingOwnership json_object, ownership is passed into this JsonObject, caller looses ownership!
    JsonObject(struct json_object *aObjPassingOwnership);

  public:

    /// destructor, releases internally kept json_object (which is possibly owned by other objects)
    virtual ~JsonObject();

    /// factory to return smart pointer to new wrapper of a newly created json_object
    /// @param aObjPassingOwnership json_object, ownership is passed into this JsonObject, caller looses ownership!
    static JsonObjectPtr newObj(struct json_object *aObjPassingOwnership);

    /// get type
    /// @return type code
    json_type type();

    /// check type
    /// @param aRefType type to check for
    /// @return true if object matches given type
    bool isType(json_type aRefType);

    /// string representation of object.
    /// @param aFlags json-c JSON_C_TO_STRING_xxx flags, defaults to compact representation without any spaces
    const char *json_c_str(int aFlags=JSON_TEXT_DEFAULT_FLAGS);
    string json_str(int aFlags=JSON_TEXT_DEFAULT_FLAGS);

    /// string representation of a possibly NULL object
    /// @param aObj object to represent, can be NULL
    /// @return JSON text, "null" for a NULL object
    static string text(JsonObjectPtr aObj);


    /// add object for key
    void add(const char* aKey, JsonObjectPtr aObj);

    /// get object by key
    /// @param aKey key of object
    /// @return the value of the object
    /// @note to distinguish between having no such key and having the key with
    ///   a NULL object, use get(aKey,aJsonObject) instead
    JsonObjectPtr get(const char *aKey);

    /// get object by key
    /// @param aKey key of object
    /// @param aJsonObject will be set to the value of the key when return value is true
    /// @return true if key exists (but aJsonObject might still be empty in case of a NULL object)
    bool get(const char *aKey, JsonObjectPtr &aJsonObject);

    /// delete object by key
    void del(const char *aKey);


    /// get array length
    /// @return length of array. Returns 0 for empty arrays and all non-array objects
    int arrayLength();

    /// append to array
    /// @param aObj object to append to the array, NULL appends a JSON null
    void arrayAppend(JsonObjectPtr aObj);

    /// get from a specific position in the array
    /// @param aAtIndex index position to return value for
    /// @return NULL pointer if element does not exist or is JSON null, value otherwise
    JsonObjectPtr arrayGet(int aAtIndex);


    /// create new empty object
    static JsonObjectPtr newObj();

    /// create new object from text
    /// @param aJsonText the JSON text to parse
    /// @param aMaxChars max number of chars to parse, -1 to parse whole C string
    /// @param aErrorP if not NULL, will receive the parsing error, if any
    /// @return parsed object, NULL if parsing failed or text represents a JSON null
    static JsonObjectPtr objFromText(const char *aJsonText, ssize_t aMaxChars = -1, ErrorPtr *aErrorP = NULL);

    /// create new object from file contents
    /// @param aJsonFilePath path of the file to read
    /// @param aErrorP if not NULL, will receive the reading or parsing error, if any
    /// @return parsed object, NULL in case of error
    static JsonObjectPtr objFromFile(const char *aJsonFilePath, ErrorPtr *aErrorP = NULL);

    /// create new array object
    static JsonObjectPtr newArray();


    /// create int object
    static JsonObjectPtr newInt32(int32_t aInt32);
    /// get int value
    int32_t int32Value();

    /// create new string object
    static JsonObjectPtr newString(const char *aCStr);
    static JsonObjectPtr newString(const string &aString, bool aEmptyIsNull = false);
    /// get string value
    const char *c_strValue();
    string stringValue();

  };

} // namespace dprobe

#endif /* defined(__dprobe__jsonobject__) */
