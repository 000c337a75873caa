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

#include "probesession.hpp"
#include "responsecorrelator.hpp"
#include "reportassembler.hpp"

#include "testfakes.hpp"

using namespace dprobe;


class ProbeSessionTest : public ::testing::Test
{
protected:
  FakeCommandChannelPtr channel;
  FakeCatalogPtr catalog;
  MemoryReportStorePtr store;
  ProbeSession *session;
  ReportAssembler *assembler;
  ResponseCorrelator *correlator;

  virtual void SetUp()
  {
    channel = FakeCommandChannelPtr(new FakeCommandChannel);
    catalog = FakeCatalogPtr(new FakeCatalog);
    store = MemoryReportStorePtr(new MemoryReportStore);
    catalog->families["model.fam"].push_back(prop("p1", "Prop One"));
    catalog->families["model.fam"].push_back(prop("p2", "Prop Two"));
    catalog->all.push_back(prop("p1", "Prop One (generic)"));
    catalog->all.push_back(prop("p3", "Prop Three"));
    session = new ProbeSession(*channel, *catalog);
    assembler = new ReportAssembler(store);
    correlator = new ResponseCorrelator(*session, *assembler);
    channel->setResponseHandler(boost::bind(&ResponseCorrelator::onResponse, correlator, _1));
  }

  virtual void TearDown()
  {
    channel->setResponseHandler(ProbeResponseCB());
    delete correlator;
    delete assembler;
    delete session;
  }

  const string &lastReport()
  {
    static const string none;
    return store->payloads.empty() ? none : store->payloads.back();
  }
};


TEST_F(ProbeSessionTest, ModelFamily)
{
  EXPECT_EQ("model.fam", CandidateCatalog::modelFamily("model.fam.v2"));
  EXPECT_EQ("a", CandidateCatalog::modelFamily("a.b"));
  EXPECT_EQ("plain", CandidateCatalog::modelFamily("plain"));
}


TEST_F(ProbeSessionTest, ProbesIdentityFirstThenCandidatesInCatalogOrder)
{
  ErrorPtr err = session->startBatch("model.fam.v2");
  ASSERT_TRUE(Error::isOK(err));
  ASSERT_EQ(4u, channel->sentOrder.size());
  EXPECT_EQ("miIO.info", channel->sentOrder[0]);
  EXPECT_EQ("get_prop[\"p1\"]", channel->sentOrder[1]);
  EXPECT_EQ("get_prop[\"p2\"]", channel->sentOrder[2]);
  EXPECT_EQ("get_prop[\"p3\"]", channel->sentOrder[3]);
  EXPECT_TRUE(session->isActive());
  EXPECT_EQ(1, session->getFirstRequestId());
  EXPECT_EQ(4, session->getBatchUpperBound());
  EXPECT_EQ(3u, session->numPending());
  // family descriptor wins over the generic one
  EXPECT_EQ("Prop One", session->getProbedProperties()[0].friendlyName);
}


TEST_F(ProbeSessionTest, EmptyModelIsRejected)
{
  ErrorPtr err = session->startBatch("");
  EXPECT_TRUE(Error::isError(err, DiscoveryError::domain(), DiscoveryErrorInvalidModel));
  EXPECT_TRUE(channel->sentOrder.empty());
  EXPECT_FALSE(session->isActive());
}


TEST_F(ProbeSessionTest, ExcludedBlankAndDuplicateCandidatesAreSkipped)
{
  catalog->all.push_back(prop("miot_power", "MIoT", true));
  catalog->all.push_back(prop("  ", "blank"));
  catalog->all.push_back(prop("p2", "duplicate"));
  session->startBatch("model.fam.v2");
  EXPECT_EQ(4u, channel->sentOrder.size());
  EXPECT_EQ(3u, session->getProbedProperties().size());
}


TEST_F(ProbeSessionTest, BoundaryOffset)
{
  session->setBoundaryOffset(2);
  session->startBatch("model.fam.v2");
  EXPECT_EQ(2, session->getBatchUpperBound());
  EXPECT_FALSE(session->isBatchBoundary(1));
  EXPECT_TRUE(session->isBatchBoundary(2));
  EXPECT_TRUE(session->isBatchBoundary(7));
  // offset larger than the batch never goes below the first probe
  session->setBoundaryOffset(100);
  session->startBatch("model.fam.v2");
  EXPECT_EQ(5, session->getFirstRequestId());
  EXPECT_EQ(5, session->getBatchUpperBound());
}


TEST_F(ProbeSessionTest, RefusedProbeIsSkipped)
{
  channel->failingCommand = "p2";
  ErrorPtr err = session->startBatch("model.fam.v2");
  EXPECT_TRUE(Error::isOK(err));
  EXPECT_EQ(2u, session->numPending());
  EXPECT_EQ(3, session->getBatchUpperBound());
  EXPECT_EQ("get_prop[\"p3\"]", channel->sent[3]);
}


TEST_F(ProbeSessionTest, EmptyCatalogSendsIdentityOnly)
{
  catalog->families.clear();
  catalog->all.clear();
  ErrorPtr err = session->startBatch("unknown.model.v1");
  EXPECT_TRUE(Error::isError(err, DiscoveryError::domain(), DiscoveryErrorCatalogMiss));
  ASSERT_EQ(1u, channel->sentOrder.size());
  EXPECT_EQ("miIO.info", channel->sentOrder[0]);
  EXPECT_FALSE(session->isActive());
}


TEST_F(ProbeSessionTest, EndToEndOnlyResponsivePropertyIsReported)
{
  session->startBatch("model.fam.v2");
  channel->respond(4, false, "[5]");
  channel->respond(2, false, "[]");
  channel->respond(3, true, "{\"code\":-1,\"message\":\"unknown\"}");
  channel->respond(1, false, "{\"model\":\"model.fam.v2\",\"token\":\"secret\"}");
  channel->respond(5, false, "\"ok\"");
  ASSERT_EQ(1u, store->payloads.size());
  EXPECT_NE(string::npos, lastReport().find("Property: p3              Friendly Name: Prop Three                Response: [5]\n"));
  EXPECT_EQ(string::npos, lastReport().find("Property: p1"));
  EXPECT_EQ(string::npos, lastReport().find("Property: p2"));
  EXPECT_FALSE(session->isActive());
  EXPECT_EQ(0u, session->numPending());
  // identity is still taken after the batch
  EXPECT_EQ("{\"model\":\"model.fam.v2\"}", session->getDeviceInfo());
}


TEST_F(ProbeSessionTest, ReportOrderIsProbeOrder)
{
  session->startBatch("model.fam.v2");
  channel->respond(3, false, "[\"b\"]");
  channel->respond(2, false, "[\"a\"]");
  channel->respond(1, false, "{\"model\":\"model.fam.v2\"}");
  channel->respond(4, false, "[\"c\"]");
  ASSERT_EQ(1u, store->payloads.size());
  size_t p1 = lastReport().find("Property: p1");
  size_t p2 = lastReport().find("Property: p2");
  size_t p3 = lastReport().find("Property: p3");
  ASSERT_NE(string::npos, p1);
  ASSERT_NE(string::npos, p2);
  ASSERT_NE(string::npos, p3);
  EXPECT_LT(p1, p2);
  EXPECT_LT(p2, p3);
}


TEST_F(ProbeSessionTest, SentinelPayloadsAreNotSupported)
{
  catalog->all.push_back(prop("p4"));
  catalog->all.push_back(prop("p5"));
  catalog->all.push_back(prop("p6"));
  session->startBatch("model.fam.v2");
  channel->respond(2, false, "[null]");
  channel->respond(3, false, "[]");
  channel->respond(4, false, "");
  channel->respond(5, false, "null");
  channel->respond(6, false, "[0]");
  channel->respond(7, false, "[\"on\"]");
  ASSERT_EQ(1u, store->payloads.size());
  EXPECT_EQ(string::npos, lastReport().find("Property: p1"));
  EXPECT_EQ(string::npos, lastReport().find("Property: p4"));
  EXPECT_NE(string::npos, lastReport().find("Response: [0]"));
  EXPECT_NE(string::npos, lastReport().find("Response: [\"on\"]"));
}


TEST_F(ProbeSessionTest, SupportedResultClassification)
{
  EXPECT_FALSE(ResponseCorrelator::isSupportedResult(false, "[]"));
  EXPECT_FALSE(ResponseCorrelator::isSupportedResult(false, "[null]"));
  EXPECT_FALSE(ResponseCorrelator::isSupportedResult(false, ""));
  EXPECT_FALSE(ResponseCorrelator::isSupportedResult(false, "null"));
  EXPECT_FALSE(ResponseCorrelator::isSupportedResult(true, "[1]"));
  EXPECT_TRUE(ResponseCorrelator::isSupportedResult(false, "[1]"));
  EXPECT_TRUE(ResponseCorrelator::isSupportedResult(false, "[null,1]"));
}


TEST_F(ProbeSessionTest, ResponsesOutsideWindowDoNotCount)
{
  // first batch ids 1..4, abandoned
  session->startBatch("model.fam.v2");
  // second batch ids 5..8, bound 7
  session->setBoundaryOffset(1);
  session->startBatch("model.fam.v2");
  EXPECT_EQ(5, session->getFirstRequestId());
  EXPECT_EQ(7, session->getBatchUpperBound());
  // stale answer to the first batch's p1 probe
  channel->respond(2, false, "[1]");
  EXPECT_EQ(0u, session->numSupported());
  EXPECT_TRUE(session->isActive());
  // past the bound: completes the batch, but is not recorded
  channel->respond(8, false, "[3]");
  ASSERT_EQ(1u, store->payloads.size());
  EXPECT_EQ(string::npos, lastReport().find("Property: p3"));
  EXPECT_FALSE(session->isActive());
}


TEST_F(ProbeSessionTest, SecondBatchDiscardsUnfinishedOne)
{
  session->startBatch("model.fam.v2");
  channel->respond(2, false, "[1]");
  session->startBatch("model.fam.v2");
  EXPECT_TRUE(store->payloads.empty());
  EXPECT_EQ(0u, session->numSupported());
  channel->respond(8, false, "[3]");
  ASSERT_EQ(1u, store->payloads.size());
  EXPECT_EQ(1, assembler->numReports());
  EXPECT_NE(string::npos, lastReport().find("Property: p3"));
  EXPECT_EQ(string::npos, lastReport().find("Property: p1"));
}


TEST_F(ProbeSessionTest, NoBatchNoReport)
{
  channel->respond(1, false, "[1]");
  channel->respond(100, false, "[1]");
  EXPECT_TRUE(store->payloads.empty());
}


TEST_F(ProbeSessionTest, IdentityIsSanitizedAndKeptAcrossBatches)
{
  channel->sent[42] = "miIO.info";
  channel->respond(42, false, "{\"model\":\"model.fam.v2\",\"token\":\"00112233\",\"ap\":{\"ssid\":\"home\"},\"mac\":\"AA:BB\",\"netif\":{\"localIp\":\"10.0.0.2\"},\"fw_ver\":\"1.2.3\"}");
  EXPECT_EQ("{\"model\":\"model.fam.v2\",\"fw_ver\":\"1.2.3\"}", session->getDeviceInfo());
  // error responses do not touch it
  channel->respond(42, true, "{\"code\":-1}");
  EXPECT_EQ("{\"model\":\"model.fam.v2\",\"fw_ver\":\"1.2.3\"}", session->getDeviceInfo());
  session->startBatch("model.fam.v2");
  channel->respond(4, false, "[5]");
  EXPECT_NE(string::npos, lastReport().find("Device Info: {\"model\":\"model.fam.v2\",\"fw_ver\":\"1.2.3\"}\n"));
}


TEST_F(ProbeSessionTest, NonObjectIdentityIsKeptVerbatim)
{
  EXPECT_EQ("\"just text\"", ResponseCorrelator::sanitizedIdentity("\"just text\""));
  EXPECT_EQ("[1,2]", ResponseCorrelator::sanitizedIdentity("[1,2]"));
}


TEST_F(ProbeSessionTest, ReportContainsProbeListAndTranscript)
{
  session->startBatch("model.fam.v2");
  channel->respond(2, false, "[1]");
  channel->respond(4, false, "[5]");
  EXPECT_EQ(0u, lastReport().find("Info for model.fam.v2\nProperties: p1 -> 2, p2 -> 3, p3 -> 4, \n"));
  EXPECT_NE(string::npos, lastReport().find("get_prop[\"p1\"] -> {\"id\":2,\"result\":[1]}\n"));
  EXPECT_NE(string::npos, lastReport().find("get_prop[\"p3\"] -> {\"id\":4,\"result\":[5]}\n"));
}
