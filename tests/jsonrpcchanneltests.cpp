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

#include "jsonrpcchannel.hpp"

#include "testloop.hpp"

#include <string.h>
#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

using namespace dprobe;


namespace {

  string requestText(int aId, const char *aCommand)
  {
    JsonObjectPtr req;
    ErrorPtr err = JsonRpcChannel::buildRequest(aId, aCommand, req);
    if (!Error::isOK(err) || !req) return "";
    return req->json_str();
  }

}


TEST(JsonRpcChannel, RequestWithJsonParams)
{
  EXPECT_EQ("{\"id\":1,\"method\":\"get_prop\",\"params\":[\"p1\"]}", requestText(1, "get_prop[\"p1\"]"));
  EXPECT_EQ("{\"id\":7,\"method\":\"set_power\",\"params\":[\"on\",1]}", requestText(7, "set_power [\"on\", 1]"));
}


TEST(JsonRpcChannel, RequestWithoutParams)
{
  EXPECT_EQ("{\"id\":2,\"method\":\"miIO.info\",\"params\":[]}", requestText(2, "miIO.info"));
  EXPECT_EQ("{\"id\":3,\"method\":\"miIO.info\",\"params\":[]}", requestText(3, " miIO.info[] "));
}


TEST(JsonRpcChannel, RequestWithBareWords)
{
  EXPECT_EQ("{\"id\":4,\"method\":\"get_prop\",\"params\":[\"power\",\"mode\"]}", requestText(4, "get_prop[power, mode]"));
}


TEST(JsonRpcChannel, RequestWithoutMethod)
{
  JsonObjectPtr req;
  EXPECT_FALSE(Error::isOK(JsonRpcChannel::buildRequest(1, "", req)));
  EXPECT_FALSE(Error::isOK(JsonRpcChannel::buildRequest(1, "[\"p1\"]", req)));
}


TEST(JsonRpcChannel, ParseResultReply)
{
  ProbeResponse r;
  ASSERT_TRUE(Error::isOK(JsonRpcChannel::parseReply("{\"result\":[\"on\"],\"id\":12}", r)));
  EXPECT_EQ(12, r.requestId);
  EXPECT_FALSE(r.isError);
  EXPECT_EQ("[\"on\"]", r.rawResult);
  EXPECT_EQ("{\"result\":[\"on\"],\"id\":12}", r.responseText);
}


TEST(JsonRpcChannel, ParseErrorReply)
{
  ProbeResponse r;
  ASSERT_TRUE(Error::isOK(JsonRpcChannel::parseReply("{\"id\":3,\"error\":{\"code\":-5001,\"message\":\"invalid arg\"}}", r)));
  EXPECT_EQ(3, r.requestId);
  EXPECT_TRUE(r.isError);
  EXPECT_EQ("{\"code\":-5001,\"message\":\"invalid arg\"}", r.rawResult);
}


TEST(JsonRpcChannel, ParseNullAndMissingResult)
{
  ProbeResponse r;
  ASSERT_TRUE(Error::isOK(JsonRpcChannel::parseReply("{\"id\":5,\"result\":null}", r)));
  EXPECT_EQ("null", r.rawResult);
  ProbeResponse r2;
  ASSERT_TRUE(Error::isOK(JsonRpcChannel::parseReply("{\"id\":6}", r2)));
  EXPECT_EQ("", r2.rawResult);
  EXPECT_FALSE(r2.isError);
}


TEST(JsonRpcChannel, ParseInvalidReplies)
{
  ProbeResponse r;
  EXPECT_FALSE(Error::isOK(JsonRpcChannel::parseReply("{\"id\":", r)));
  EXPECT_FALSE(Error::isOK(JsonRpcChannel::parseReply("{\"result\":[1]}", r)));
  EXPECT_FALSE(Error::isOK(JsonRpcChannel::parseReply("{\"id\":\"1\",\"result\":[1]}", r)));
  EXPECT_FALSE(Error::isOK(JsonRpcChannel::parseReply("[1,2]", r)));
}


TEST(JsonRpcChannel, SendWithoutAddressFails)
{
  JsonRpcChannelPtr channel = JsonRpcChannelPtr(new JsonRpcChannel(MainLoop::currentMainLoop()));
  ErrorPtr err;
  EXPECT_EQ(-1, channel->sendCommand("miIO.info", err));
  EXPECT_TRUE(Error::isError(err, SocketCommError::domain(), SocketCommErrorNoParams));
  EXPECT_EQ(0u, channel->numOutstanding());
}


class JsonRpcLoopbackTest : public ::testing::Test
{
public:
  std::vector<ProbeResponse> responses;

  void gotResponse(const ProbeResponse &aResponse) { responses.push_back(aResponse); };

protected:
  int deviceFd;
  uint16_t devicePort;

  virtual void SetUp()
  {
    deviceFd = socket(AF_INET, SOCK_DGRAM, 0);
    ASSERT_GE(deviceFd, 0);
    struct sockaddr_in sa;
    memset(&sa, 0, sizeof(sa));
    sa.sin_family = AF_INET;
    sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    sa.sin_port = 0;
    ASSERT_EQ(0, bind(deviceFd, (struct sockaddr *)&sa, sizeof(sa)));
    socklen_t len = sizeof(sa);
    ASSERT_EQ(0, getsockname(deviceFd, (struct sockaddr *)&sa, &len));
    devicePort = ntohs(sa.sin_port);
  }

  virtual void TearDown()
  {
    ::close(deviceFd);
  }

  /// receive one request as the device, answer with the given text
  string answer(const char *aReplyFormat)
  {
    char buf[1500];
    struct sockaddr_in from;
    socklen_t fromLen = sizeof(from);
    ssize_t n = recvfrom(deviceFd, buf, sizeof(buf)-1, 0, (struct sockaddr *)&from, &fromLen);
    if (n<0) return "";
    buf[n] = 0;
    JsonObjectPtr req = JsonObject::objFromText(buf);
    int id = req && req->get("id") ? req->get("id")->int32Value() : 0;
    string reply = string_format(aReplyFormat, id);
    sendto(deviceFd, reply.c_str(), reply.size(), 0, (struct sockaddr *)&from, fromLen);
    return buf;
  }
};


TEST_F(JsonRpcLoopbackTest, RequestAndReply)
{
  JsonRpcChannelPtr channel = JsonRpcChannelPtr(new JsonRpcChannel(MainLoop::currentMainLoop()));
  channel->setDeviceAddress("127.0.0.1", devicePort);
  channel->setResponseHandler(boost::bind(&JsonRpcLoopbackTest::gotResponse, this, _1));
  ErrorPtr err;
  int id1 = channel->sendCommand("miIO.info", err);
  ASSERT_TRUE(Error::isOK(err));
  int id2 = channel->sendCommand("get_prop[\"power\"]", err);
  ASSERT_TRUE(Error::isOK(err));
  EXPECT_EQ(1, id1);
  EXPECT_EQ(2, id2);
  EXPECT_EQ(2u, channel->numOutstanding());
  EXPECT_EQ("{\"id\":1,\"method\":\"miIO.info\",\"params\":[]}", answer("{\"id\":%d,\"result\":{\"model\":\"a.b.c\"}}"));
  EXPECT_EQ("{\"id\":2,\"method\":\"get_prop\",\"params\":[\"power\"]}", answer("{\"id\":%d,\"result\":[\"on\"]}"));
  runLoopFor(50*MilliSecond);
  ASSERT_EQ(2u, responses.size());
  EXPECT_EQ(1, responses[0].requestId);
  EXPECT_EQ(CommandKindInfo, responses[0].kind);
  EXPECT_EQ("miIO.info", responses[0].commandString);
  EXPECT_EQ(2, responses[1].requestId);
  EXPECT_EQ(CommandKindGetProp, responses[1].kind);
  EXPECT_EQ("[\"on\"]", responses[1].rawResult);
  EXPECT_EQ(0u, channel->numOutstanding());
  channel->close();
}


TEST_F(JsonRpcLoopbackTest, GarbageIsIgnored)
{
  JsonRpcChannelPtr channel = JsonRpcChannelPtr(new JsonRpcChannel(MainLoop::currentMainLoop()));
  channel->setDeviceAddress("127.0.0.1", devicePort);
  channel->setResponseHandler(boost::bind(&JsonRpcLoopbackTest::gotResponse, this, _1));
  ErrorPtr err;
  channel->sendCommand("get_prop[\"power\"]", err);
  ASSERT_TRUE(Error::isOK(err));
  answer("garbage %d");
  runLoopFor(30*MilliSecond);
  EXPECT_TRUE(responses.empty());
  EXPECT_EQ(1u, channel->numOutstanding());
  channel->close();
}


TEST_F(JsonRpcLoopbackTest, UnansweredCommandsAreCapped)
{
  JsonRpcChannelPtr channel = JsonRpcChannelPtr(new JsonRpcChannel(MainLoop::currentMainLoop()));
  channel->setDeviceAddress("127.0.0.1", devicePort);
  channel->setResponseHandler(boost::bind(&JsonRpcLoopbackTest::gotResponse, this, _1));
  channel->setMaxOutstanding(3);
  ErrorPtr err;
  for (int i=0; i<5; i++) {
    channel->sendCommand(string_format("get_prop[\"p%d\"]", i+1), err);
    ASSERT_TRUE(Error::isOK(err));
  }
  // device never answers the first two, only the newest three are remembered
  EXPECT_EQ(3u, channel->numOutstanding());
  answer("{\"id\":%d,\"result\":[1]}"); // #1, forgotten already
  runLoopFor(30*MilliSecond);
  ASSERT_EQ(1u, responses.size());
  EXPECT_EQ(1, responses[0].requestId);
  EXPECT_EQ("", responses[0].commandString);
  EXPECT_EQ(3u, channel->numOutstanding());
  channel->close();
}
