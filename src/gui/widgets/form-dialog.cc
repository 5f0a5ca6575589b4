#include "stdinc.hpp"

#include "form-dialog.hh"

#include "gui/qt-helpers.hpp"

#include <QDialogButtonBox>

#define This FormDialog

using namespace fauna;

static constexpr int k_label_min_width = 100;

This::This(const string_view title,
           const vector<FieldSpec>& fields,
           QWidget* parent)
    : QDialog(parent)
{
   form_ = new FormBuilderLayout(fields);

   auto buttons
       = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel);
   connect(buttons, SIGNAL(accepted()), this, SLOT(accept()));
   connect(buttons, SIGNAL(rejected()), this, SLOT(reject()));

   auto layout = new QVBoxLayout;
   layout->addLayout(form_);
   layout->addWidget(buttons);
   setLayout(layout);

   for_each_qform_label(form_, [](QWidget* wgt) {
      wgt->setMinimumWidth(k_label_min_width);
   });

   setWindowTitle(to_qstr(title));
   setModal(true);
}

// --------------------------------------------------------------- get-form-data

Json::Value This::get_form_data(QWidget* parent,
                                const string_view title,
                                const vector<FieldSpec>& fields,
                                const Json::Value& initial) noexcept(false)
{
   FormDialog dialog(title, fields, parent);
   if(initial.isObject()) dialog.form()->set_form_data(initial);
   if(dialog.exec() != QDialog::Accepted) return Json::Value{Json::nullValue};
   return dialog.form_data();
}
