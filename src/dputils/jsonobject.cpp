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


#include "jsonobject.hpp"

#include <stdio.h>
#include <string.h>
#include <errno.h>

using namespace dprobe;


#pragma mark - private constructors / destructor


// construct from raw json_object, passing ownership
JsonObject::JsonObject(struct json_object *aObjPassingOwnership) :
  json_obj(aObjPassingOwnership)
{
}


JsonObject::~JsonObject()
{
  if (json_obj) {
    json_object_put(json_obj);
    json_obj = NULL;
  }
}


#pragma mark - type


json_type JsonObject::type()
{
  return json_object_get_type(json_obj);
}


bool JsonObject::isType(json_type aRefType)
{
  return json_object_is_type(json_obj, aRefType);
}


#pragma mark - conversion to string

const char *JsonObject::json_c_str(int aFlags)
{
  return json_object_to_json_string_ext(json_obj, aFlags);
}


string JsonObject::json_str(int aFlags)
{
  return string(json_c_str(aFlags));
}


string JsonObject::text(JsonObjectPtr aObj)
{
  if (!aObj) return "null";
  return aObj->json_str();
}


#pragma mark - add, get and delete by key

void JsonObject::add(const char* aKey, JsonObjectPtr aObj)
{
  // json_object_object_add assumes caller relinquishing ownership,
  // so we must compensate this by retaining (getting) the object
  // as the object still belongs to us
  // Except if a NULL (no object) is passed
  json_object_object_add(json_obj, aKey, aObj ? json_object_get(aObj->json_obj) : NULL);
}


bool JsonObject::get(const char *aKey, JsonObjectPtr &aJsonObject)
{
  json_object *weakObjRef = NULL;
  if (json_object_object_get_ex(json_obj, aKey, &weakObjRef)) {
    // found object, but can be the NULL object (which will return no JsonObjectPtr)
    if (weakObjRef==NULL) {
      aJsonObject = JsonObjectPtr(); // no object
    }
    else {
      // - claim ownership as json_object_object_get_ex does not do that automatically
      json_object_get(weakObjRef);
      // - create wrapper
      aJsonObject = newObj(weakObjRef);
    }
    return true; // key exists, but returned object might still be NULL
  }
  return false; // key does not exist, aJsonObject unchanged
}


JsonObjectPtr JsonObject::get(const char *aKey)
{
  JsonObjectPtr p;
  get(aKey, p);
  return p;
}


void JsonObject::del(const char *aKey)
{
  json_object_object_del(json_obj, aKey);
}


#pragma mark - arrays


int JsonObject::arrayLength()
{
  if (type()!=json_type_array)
    return 0; // normal objects don't have a length
  return (int)json_object_array_length(json_obj);
}


void JsonObject::arrayAppend(JsonObjectPtr aObj)
{
  if (type()==json_type_array) {
    // - claim ownership as json_object_array_add does not do that automatically
    json_object_array_add(json_obj, aObj ? json_object_get(aObj->json_obj) : NULL);
  }
}


JsonObjectPtr JsonObject::arrayGet(int aAtIndex)
{
  JsonObjectPtr p;
  if (type()!=json_type_array || aAtIndex<0 || aAtIndex>=arrayLength()) return p;
  json_object *weakObjRef = json_object_array_get_idx(json_obj, aAtIndex);
  if (weakObjRef) {
    // found object
    // - claim ownership as json_object_array_get_idx does not do that automatically
    json_object_get(weakObjRef);
    // - return wrapper
    p = newObj(weakObjRef);
  }
  return p;
}


#pragma mark - factories and value getters

// private wrapper factory from newly created json_object (ownership passed in)
JsonObjectPtr JsonObject::newObj(struct json_object *aObjPassingOwnership)
{
  return JsonObjectPtr(new JsonObject(aObjPassingOwnership));
}


JsonObjectPtr JsonObject::newObj()
{
  return JsonObjectPtr(new JsonObject(json_object_new_object()));
}


JsonObjectPtr JsonObject::objFromText(const char *aJsonText, ssize_t aMaxChars, ErrorPtr *aErrorP)
{
  JsonObjectPtr obj;
  if (!aJsonText) aJsonText = "";
  if (aMaxChars<0) aMaxChars = (ssize_t)strlen(aJsonText);
  struct json_tokener* tokener = json_tokener_new();
  struct json_object *o = json_tokener_parse_ex(tokener, aJsonText, (int)aMaxChars);
  enum json_tokener_error jerr = json_tokener_get_error(tokener);
  if (jerr==json_tokener_continue) {
    // incomplete (e.g. a number at the very end of the text), signal end of text with a NUL
    o = json_tokener_parse_ex(tokener, "", 1);
    jerr = json_tokener_get_error(tokener);
  }
  if (jerr==json_tokener_success) {
    if (o) obj = JsonObject::newObj(o);
  }
  else if (aErrorP) {
    *aErrorP = ErrorPtr(new JsonError(jerr));
  }
  json_tokener_free(tokener);
  return obj;
}


JsonObjectPtr JsonObject::objFromFile(const char *aJsonFilePath, ErrorPtr *aErrorP)
{
  FILE *f = fopen(aJsonFilePath, "r");
  if (!f) {
    if (aErrorP) *aErrorP = SysError::errNo("cannot open JSON file: ");
    return JsonObjectPtr();
  }
  string text;
  char buf[1024];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), f))>0) {
    text.append(buf, n);
  }
  bool readError = ferror(f)!=0;
  fclose(f);
  if (readError) {
    if (aErrorP) *aErrorP = TextError::err("error reading JSON file '%s'", aJsonFilePath);
    return JsonObjectPtr();
  }
  ErrorPtr err;
  JsonObjectPtr obj = objFromText(text.c_str(), (ssize_t)text.size(), &err);
  if (!obj && Error::isOK(err)) {
    err = ErrorPtr(new JsonError(json_tokener_error_parse_eof, "JSON file contains no object"));
  }
  if (aErrorP) *aErrorP = err;
  return obj;
}


JsonObjectPtr JsonObject::newArray()
{
  return JsonObjectPtr(new JsonObject(json_object_new_array()));
}


JsonObjectPtr JsonObject::newInt32(int32_t aInt32)
{
  return newObj(json_object_new_int(aInt32));
}

int32_t JsonObject::int32Value()
{
  return json_object_get_int(json_obj);
}


JsonObjectPtr JsonObject::newString(const char *aCStr)
{
  if (!aCStr) return JsonObjectPtr();
  return newObj(json_object_new_string(aCStr));
}

JsonObjectPtr JsonObject::newString(const string &aString, bool aEmptyIsNull)
{
  if (aEmptyIsNull && aString.empty()) return JsonObjectPtr();
  return JsonObject::newString(aString.c_str());
}

const char *JsonObject::c_strValue()
{
  return json_object_get_string(json_obj);
}

string JsonObject::stringValue()
{
  return string(nonNullCStr(c_strValue()));
}
