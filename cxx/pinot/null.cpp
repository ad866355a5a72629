#include "inputs.hpp"

#include "pn/init/null.hpp"
#include "pn/io/reader.hpp"
#include "pn/io/writer.hpp"
#include "pn/log/log.hpp"

using namespace pn;

void main_null(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Input HD5 file with matrix and measurements");
  args::Positional<std::string> oname(parser, "FILE", "Output HD5 file");
  NullArgs                      nullArgs(parser);
  ParseCommand(parser, iname, oname);
  auto const  cmd = parser.GetCommand().Name();
  HD5::Reader reader(iname.Get());

  auto const A = reader.readMatrix();
  auto const b0 = reader.readMeasurements();
  Log::Print(cmd, "Sensing matrix [{},{}] measurements {}", A.rows(), A.cols(), b0.rows());
  auto const x0 = NullInitialize(A, b0, nullArgs.Get());

  HD5::Writer writer(oname.Get());
  writer.writeTensor(HD5::Keys::Data, HD5::Shape<1>{x0.rows()}, x0.data(), HD5::Dims::Signal);
  writer.writeStrings(HD5::Keys::Log, Log::Saved());
  Log::Print(cmd, "Finished");
}
