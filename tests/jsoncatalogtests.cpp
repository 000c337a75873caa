//
//  Copyright (c) 2016 the dprobe authors
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


#include <gtest/gtest.h>

#include "jsoncatalog.hpp"
#include "discoveryerror.hpp"

#include <stdlib.h>
#include <stdio.h>

using namespace dprobe;


class JsonCatalogTest : public ::testing::Test
{
protected:
  string dir;

  virtual void SetUp()
  {
    char tmpl[] = "/tmp/dprobe-catalog-XXXXXX";
    ASSERT_TRUE(mkdtemp(tmpl)!=NULL);
    dir = tmpl;
  }

  virtual void TearDown()
  {
    string cmd = "rm -rf '" + dir + "'";
    EXPECT_EQ(0, system(cmd.c_str()));
  }

  void writeFile(const char *aName, const char *aContent)
  {
    FILE *f = fopen((dir + "/" + aName).c_str(), "w");
    ASSERT_TRUE(f!=NULL);
    fputs(aContent, f);
    fclose(f);
  }

  static string names(const PropertyDescriptorList &aList)
  {
    string s;
    for (PropertyDescriptorList::const_iterator pos = aList.begin(); pos!=aList.end(); ++pos) {
      if (!s.empty()) s += ",";
      s += pos->propertyName;
      if (pos->excludedProtocol) s += "(x)";
    }
    return s;
  }
};


TEST_F(JsonCatalogTest, LoadsFilesInNameOrder)
{
  writeFile("b.json",
    "{\"deviceMapping\":{\"id\":[\"zhimi.fan.v3\"],\"channels\":["
    "{\"property\":\"speed\",\"friendlyName\":\"Speed\"}]}}");
  writeFile("a.json",
    "{\"deviceMapping\":{\"id\":[\"zhimi.fan.sa1\",\"zhimi.fan.za1\"],\"channels\":["
    "{\"property\":\"power\",\"friendlyName\":\"Power\"},"
    "{\"property\":\"on\",\"siid\":2,\"piid\":1}]}}");
  writeFile("readme.txt", "not a catalog file");
  JsonCatalogPtr catalog = JsonCatalogPtr(new JsonCatalog(dir));
  PropertyDescriptorList list;
  EXPECT_TRUE(Error::isOK(catalog->listCandidateProperties("zhimi.fan", list)));
  EXPECT_EQ(2u, catalog->numDevices());
  EXPECT_EQ("power,on(x),speed", names(list));
  EXPECT_EQ("Power", list[0].friendlyName);
  EXPECT_EQ("", list[1].friendlyName);
}


TEST_F(JsonCatalogTest, FamilyMatchesModelPrefix)
{
  writeFile("fan.json", "{\"deviceMapping\":{\"id\":[\"zhimi.fan.v3\"],\"channels\":[{\"property\":\"speed\"}]}}");
  writeFile("lamp.json", "{\"deviceMapping\":{\"id\":[\"yeelink.light.lamp1\"],\"channels\":[{\"property\":\"bright\"}]}}");
  JsonCatalogPtr catalog = JsonCatalogPtr(new JsonCatalog(dir));
  PropertyDescriptorList list;
  catalog->listCandidateProperties("yeelink.light", list);
  EXPECT_EQ("bright", names(list));
  list.clear();
  catalog->listCandidateProperties("chuangmi.plug", list);
  EXPECT_TRUE(list.empty());
  list.clear();
  // empty family lists everything
  catalog->listCandidateProperties("", list);
  EXPECT_EQ("speed,bright", names(list));
}


TEST_F(JsonCatalogTest, MalformedFilesAreSkipped)
{
  writeFile("1.json", "{\"deviceMapping\":{\"id\":[\"a.b.c\"],\"channels\":[{\"property\":\"p1\"}, 42]}}");
  writeFile("2.json", "{ this is not json");
  writeFile("3.json", "{\"deviceMapping\":{\"channels\":[]}}");
  writeFile("4.json", "{\"other\":true}");
  JsonCatalogPtr catalog = JsonCatalogPtr(new JsonCatalog(dir));
  EXPECT_TRUE(Error::isOK(catalog->load()));
  EXPECT_EQ(1u, catalog->numDevices());
  PropertyDescriptorList list;
  catalog->listCandidateProperties("a.b", list);
  EXPECT_EQ("p1", names(list));
}


TEST_F(JsonCatalogTest, MissingDirectoryIsAnError)
{
  JsonCatalogPtr catalog = JsonCatalogPtr(new JsonCatalog(dir + "/nonexistent"));
  PropertyDescriptorList list;
  EXPECT_FALSE(Error::isOK(catalog->listCandidateProperties("a.b", list)));
  EXPECT_TRUE(list.empty());
}


TEST_F(JsonCatalogTest, DeviceDefinitionValidation)
{
  JsonCatalogPtr catalog = JsonCatalogPtr(new JsonCatalog(dir));
  EXPECT_TRUE(Error::isError(catalog->addDeviceDefinition(JsonObjectPtr(), "none"), DiscoveryError::domain(), DiscoveryErrorMalformedEntry));
  EXPECT_TRUE(Error::isError(catalog->addDeviceDefinition(JsonObject::objFromText("{\"deviceMapping\":{\"id\":\"a.b.c\",\"channels\":[]}}"), "x"), DiscoveryError::domain(), DiscoveryErrorMalformedEntry));
  EXPECT_TRUE(Error::isError(catalog->addDeviceDefinition(JsonObject::objFromText("{\"deviceMapping\":{\"id\":[\"a.b.c\"]}}"), "x"), DiscoveryError::domain(), DiscoveryErrorMalformedEntry));
  EXPECT_TRUE(Error::isOK(catalog->addDeviceDefinition(JsonObject::objFromText("{\"deviceMapping\":{\"id\":[\"a.b.c\"],\"channels\":[{\"friendlyName\":\"nameless\"}]}}"), "x")));
  EXPECT_EQ(1u, catalog->numDevices());
}


TEST_F(JsonCatalogTest, CandidatesForModelUseFamilyThenGeneric)
{
  writeFile("fan.json",
    "{\"deviceMapping\":{\"id\":[\"zhimi.fan.v3\"],\"channels\":["
    "{\"property\":\"power\"},{\"property\":\"\"},{\"property\":\"power\"},{\"property\":\"on\",\"siid\":2}]}}");
  writeFile("lamp.json", "{\"deviceMapping\":{\"id\":[\"yeelink.light.lamp1\"],\"channels\":[{\"property\":\"bright\"}]}}");
  JsonCatalogPtr catalog = JsonCatalogPtr(new JsonCatalog(dir));
  PropertyDescriptorList list;
  EXPECT_TRUE(Error::isOK(catalog->candidatesForModel("zhimi.fan.v3", list)));
  // own family first, then the rest of the database
  EXPECT_EQ("power,bright", names(list));
  list.clear();
  EXPECT_TRUE(Error::isOK(catalog->candidatesForModel("yeelink.light.lamp1", list)));
  EXPECT_EQ("bright,power", names(list));
  list.clear();
  EXPECT_TRUE(Error::isOK(catalog->candidatesForModel("unknown.thing.v1", list)));
  EXPECT_EQ("power,bright", names(list));
}
